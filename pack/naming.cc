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

#include "pack/naming.h"

#include <ctype.h>
#include <string.h>
#include <vector>
#include "common/common_util.h"

namespace mmp {
namespace {
constexpr char kWordDelimiters[] = "_- ";
constexpr char kOutputExtension[] = ".png";

// Find capitalized words: one uppercase letter followed by any number of
// lowercase letters. Other characters are not part of any word.
void SplitCapitalizedWords(const std::string& name,
                           std::vector<std::string>* out_words) {
  out_words->clear();
  const size_t len = name.length();
  size_t pos = 0;
  while (pos != len) {
    if (!isupper(static_cast<unsigned char>(name[pos]))) {
      ++pos;
      continue;
    }
    const size_t begin = pos++;
    while (pos != len && islower(static_cast<unsigned char>(name[pos]))) {
      ++pos;
    }
    out_words->push_back(name.substr(begin, pos - begin));
  }
}
}  // namespace

bool RemoveLastWord(const std::string& name, std::string* out_base) {
  const size_t delimiter_pos = name.find_last_of(kWordDelimiters);
  if (delimiter_pos != std::string::npos) {
    *out_base = name.substr(0, delimiter_pos + 1);
    return true;
  }

  std::vector<std::string> words;
  SplitCapitalizedWords(name, &words);
  if (words.size() > 1) {
    out_base->clear();
    for (size_t i = 0; i != words.size() - 1; ++i) {
      *out_base += words[i];
    }
    return true;
  }

  if (name.length() <= 1) {
    *out_base = name;
    return false;
  }
  *out_base = name.substr(0, name.length() - 1);
  return true;
}

std::string DeriveName(const char* base_name) {
  if (!base_name) {
    return kMaskNameDefault;
  }
  const std::string name = base_name;
  if (StringEndsWith(name, kMaskNameSuffix)) {
    return name;
  }
  std::string base;
  if (!RemoveLastWord(name, &base)) {
    return name;
  }
  return base + kMaskNameSuffix;
}

std::string GetDefaultOutputPath(
    const std::string (&source_paths)[kMaskSlotCount]) {
  for (const std::string& path : source_paths) {
    if (!path.empty()) {
      const std::string stem = GetFileStem(path);
      return JoinPath(GetFileDirectory(path),
                      DeriveName(stem.c_str()) + kOutputExtension);
    }
  }
  return std::string(kMaskNameDefault) + kOutputExtension;
}

std::string GetDefaultOutputPath(const PackSettings& settings) {
  const std::string paths[kMaskSlotCount] = {
    settings.metallic_path,
    settings.occlusion_path,
    settings.detail_path,
    settings.smoothness_path,
  };
  return GetDefaultOutputPath(paths);
}
}  // namespace mmp
