/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef MMP_COMMON_COMMON_UTIL_H_
#define MMP_COMMON_COMMON_UTIL_H_

#include <ctype.h>
#include <string.h>
#include <string>
#include "common/common.h"

namespace mmp {
inline bool StringEqualCI(const char* text0, size_t len0,
                          const char* text1, size_t len1) {
  if (len0 != len1) {
    return false;
  }
  for (size_t i = 0; i != len0; ++i) {
    if (tolower(static_cast<unsigned char>(text0[i])) !=
        tolower(static_cast<unsigned char>(text1[i]))) {
      return false;
    }
  }
  return true;
}

inline bool StringEqualCI(const char* text0, const char* text1) {
  return StringEqualCI(text0, strlen(text0), text1, strlen(text1));
}

inline bool StringEndsWith(const std::string& text, const char* suffix) {
  const size_t suffix_len = strlen(suffix);
  return text.length() >= suffix_len &&
         text.compare(text.length() - suffix_len, suffix_len, suffix) == 0;
}

inline const char* GetFileName(const std::string& path) {
  const size_t last_slash_pos = path.find_last_of("\\/");
  return last_slash_pos == std::string::npos
             ? path.c_str()
             : path.c_str() + last_slash_pos + 1;
}

inline std::string GetFileDirectory(const std::string& path) {
  const size_t last_slash_pos = path.find_last_of("\\/");
  return last_slash_pos == std::string::npos
             ? std::string()
             : std::string(path.c_str(), last_slash_pos);
}

// File name without directory or extension (e.g. "a/Rock_AO.png" -> "Rock_AO").
inline std::string GetFileStem(const std::string& path) {
  const std::string name = GetFileName(path);
  const size_t last_dot_pos = name.rfind('.');
  return last_dot_pos == std::string::npos || last_dot_pos == 0
             ? name
             : name.substr(0, last_dot_pos);
}

inline std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) {
    return name;
  }
  const char last = dir[dir.length() - 1];
  return last == '/' || last == '\\' ? dir + name : dir + '/' + name;
}
}  // namespace mmp

#endif  // MMP_COMMON_COMMON_UTIL_H_
