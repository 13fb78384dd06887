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

#ifndef MMP_COMMON_LOGGING_H_
#define MMP_COMMON_LOGGING_H_

#include <chrono>
#include <stdexcept>
#include <string>
#include "common/common.h"
#include "common/message.h"

#define MMP_ASSERT_HELPER(x, file, line, expression)            \
do {                                                            \
  if (!(x)) {                                                   \
    throw mmp::AssertException(file, line, expression);         \
  }                                                             \
} while (0)

#define MMP_ASSERT(x) MMP_ASSERT_HELPER(x, __FILE__, __LINE__, #x)

// Asserts for malformed image data.
#define MMP_ASSERT_FORMAT(x) MMP_ASSERT(x)

// Asserts that should only occur due to logic bugs.
#define MMP_ASSERT_LOGIC(x) MMP_ASSERT(x)

namespace mmp {
enum What : uint8_t {
#define MMP_MSG(severity, id, format) \
  MMP_##severity##_##id,
#include "messages.inl"  // NOLINT: Multiple inclusion.
  MMP_WHAT_COUNT
};

extern const WhatInfo kWhatInfos[MMP_WHAT_COUNT];

template <What kWhat> struct LoggerT;

#define MMP_MSG0(severity, id, format)                             \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get() {                                         \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "");                 \
    }                                                              \
  };
#define MMP_MSG1(severity, id, format,                             \
                 T0, v0)                                           \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get(T0 v0) {                                    \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "",                  \
          v0);                                                     \
    }                                                              \
  };
#define MMP_MSG2(severity, id, format,                             \
                 T0, v0, T1, v1)                                   \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1) {                             \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "",                  \
          v0, v1);                                                 \
    }                                                              \
  };
#define MMP_MSG3(severity, id, format,                             \
                 T0, v0, T1, v1, T2, v2)                           \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1, T2 v2) {                      \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "",                  \
          v0, v1, v2);                                             \
    }                                                              \
  };
#define MMP_MSG4(severity, id, format,                             \
                 T0, v0, T1, v1, T2, v2, T3, v3)                   \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1, T2 v2, T3 v3) {               \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "",                  \
          v0, v1, v2, v3);                                         \
    }                                                              \
  };
#define MMP_MSG5(severity, id, format,                             \
                 T0, v0, T1, v1, T2, v2, T3, v3, T4, v4)           \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1, T2 v2, T3 v3, T4 v4) {        \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "",                  \
          v0, v1, v2, v3, v4);                                     \
    }                                                              \
  };
#define MMP_MSG6(severity, id, format,                             \
                 T0, v0, T1, v1, T2, v2, T3, v3, T4, v4, T5, v5)   \
  template <> struct LoggerT<MMP_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1, T2 v2, T3 v3, T4 v4, T5 v5) { \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[MMP_##severity##_##id], "",                  \
          v0, v1, v2, v3, v4, v5);                                 \
    }                                                              \
  };
#include "messages.inl"  // NOLINT: Multiple inclusion.

template <What kWhat, typename ...Ts>
inline void Log(Logger* logger, const char* path, Ts... args) {
  Message message = LoggerT<kWhat>::Get(args...);
  message.path = path && path[0] ? path : logger->GetName();
  logger->Add(message);
}

class AssertException : public std::runtime_error {
 public:
  AssertException(const char* file, int line, const char* expression);
  const char* GetFile() const { return file_; }
  int GetLine() const { return line_; }
  const char* GetExpression() const { return expression_; }
 private:
  const char* file_;
  int line_;
  const char* expression_;
};

// Logs the wall time spent in a local function scope as MMP_INFO_TIMING. Does
// nothing if logger is null.
class ProfileSentry {
 public:
  ProfileSentry(Logger* logger, const char* label);
  ~ProfileSentry();
 private:
  Logger* logger_;
  const char* label_;
  std::chrono::steady_clock::time_point time_begin_;
};

}  // namespace mmp
#endif  // MMP_COMMON_LOGGING_H_
