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

#include "common/logging.h"

#include <cstdio>

namespace mmp {
namespace {
constexpr size_t kFormatTextMax = 8 * 1024;

constexpr Severity WHAT_SEVERITY_INFO = kSeverityNone;
constexpr Severity WHAT_SEVERITY_WARN = kSeverityWarning;
constexpr Severity WHAT_SEVERITY_ERROR = kSeverityError;

std::string GetAssertText(const char* file, int line, const char* expression) {
  char text[kFormatTextMax];
  snprintf(text, sizeof(text), "%s(%d) : ASSERT(%s)", file, line, expression);
  return text;
}
}  // namespace

const WhatInfo kWhatInfos[MMP_WHAT_COUNT] = {
#define MMP_MSG(severity, id, format) \
  {WHAT_SEVERITY_##severity, "MMP_" #severity "_" #id, format},
#include "messages.inl"  // NOLINT: Multiple inclusion.
};

AssertException::AssertException(const char* file, int line,
                                 const char* expression)
    : std::runtime_error(GetAssertText(file, line, expression)),
      file_(file),
      line_(line),
      expression_(expression) {}

ProfileSentry::ProfileSentry(Logger* logger, const char* label)
    : logger_(logger), label_(label) {
  if (logger_) {
    time_begin_ = std::chrono::steady_clock::now();
  }
}

ProfileSentry::~ProfileSentry() {
  if (logger_) {
    const std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - time_begin_;
    Log<MMP_INFO_TIMING>(logger_, "", label_, elapsed.count());
  }
}
}  // namespace mmp
