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

#include "common/message.h"

#include <cstdio>
#include "common/common.h"

namespace mmp {
std::string Message::ToString() const {
  static const char* const kSeverityText[] = {
      "",           // kSeverityNone
      "Warning: ",  // kSeverityWarning
      "ERROR: ",    // kSeverityError
  };
  static_assert(MMP_ARRAY_SIZE(kSeverityText) == kSeverityCount, "");
  std::string str = kSeverityText[what_info->severity];
  if (!path.empty()) {
    str += path;
    str += ": ";
  }
  str += text;
  str += " [";
  str += what_info->name;
  str += "]";
  return str;
}

void Message::AssignFormattedV(
    const WhatInfo* what_info, const char* path, va_list args) {
  // Args cannot be reused in GCC, so copy it for the second call to vsnprintf.
  va_list args_copy;
  va_copy(args_copy, args);

  this->what_info = what_info;
  this->path = path ? path : "";
  const int len = std::vsnprintf(nullptr, 0, what_info->format, args);
  if (len <= 0) {
    text.clear();
  } else {
    text.resize(len);
    std::vsnprintf(&text[0], len + 1, what_info->format, args_copy);
  }

  va_end(args_copy);
}

size_t Message::CountErrors(const std::vector<Message>& messages) {
  size_t error_count = 0;
  for (const Message& message : messages) {
    if (message.GetSeverity() == kSeverityError) {
      ++error_count;
    }
  }
  return error_count;
}

void PrintMessage(const Message& message) {
  FILE* const target =
      message.GetSeverity() == kSeverityNone ? stdout : stderr;
  fprintf(target, "%s\n", message.ToString().c_str());
}
}  // namespace mmp
