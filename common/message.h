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

#ifndef MMP_COMMON_MESSAGE_H_
#define MMP_COMMON_MESSAGE_H_

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <string>
#include <vector>

namespace mmp {
enum Severity : uint8_t {
  kSeverityNone,
  kSeverityWarning,
  kSeverityError,
  kSeverityCount
};

// Static description of a message type, declared in messages.inl.
struct WhatInfo {
  Severity severity;
  const char* name;
  const char* format;
};

struct Message {
  const WhatInfo* what_info;
  std::string path;
  std::string text;

  // "<severity>: <path>: <text> [<what>]", omitting empty parts.
  std::string ToString() const;

  Severity GetSeverity() const { return what_info->severity; }

  void AssignFormattedV(
      const WhatInfo* what_info, const char* path, va_list args);

  static Message ConstructFormatted(
      const WhatInfo* what_info, const char* path, ...) {
    Message message;
    va_list args;
    va_start(args, path);
    message.AssignFormattedV(what_info, path, args);
    va_end(args);
    return message;
  }

  static size_t CountErrors(const std::vector<Message>& messages);
};

// Print a message to stdout, or to stderr for warnings and errors.
void PrintMessage(const Message& message);

// Abstract interface used to log messages.
class Logger {
 public:
  virtual ~Logger() {}
  virtual void Add(const Message& message) = 0;
  virtual size_t GetErrorCount() const = 0;

  // Push/pop the name of the current object being logged (e.g. the slot being
  // loaded), used to provide additional context in messages.
  void PushName(const std::string& name) { names_.push_back(name); }
  void PopName() { names_.pop_back(); }

  // Get the current object name, if any.
  const std::string& GetName() const {
    return names_.empty() ? empty_name_ : names_.back();
  }

  // Push/Pop object name within a local function scope.
  struct NameSentry {
    Logger* logger;
    NameSentry(Logger* logger, const std::string& name) : logger(logger) {
      logger->PushName(name);
    }
    ~NameSentry() { logger->PopName(); }
  };

 private:
  std::string empty_name_;
  std::vector<std::string> names_;
};

// Logger that prints as messages arrive.
class PrintLogger : public Logger {
 public:
  PrintLogger() : error_count_(0) {}

  void Add(const Message& message) override {
    PrintMessage(message);
    if (message.GetSeverity() == kSeverityError) {
      ++error_count_;
    }
  }

  size_t GetErrorCount() const override {
    return error_count_;
  }

 private:
  size_t error_count_;
};

// Logger that stores messages in a vector.
class VectorLogger : public Logger {
 public:
  void Add(const Message& message) override {
    messages_.push_back(message);
  }

  size_t GetErrorCount() const override {
    return Message::CountErrors(messages_);
  }

  void Clear() {
    messages_.clear();
  }

  const std::vector<Message>& GetMessages() const {
    return messages_;
  }

  // Returns true if any stored message has the given type.
  bool Contains(const WhatInfo* what_info) const {
    for (const Message& message : messages_) {
      if (message.what_info == what_info) {
        return true;
      }
    }
    return false;
  }

 private:
  std::vector<Message> messages_;
};
}  // namespace mmp

#endif  // MMP_COMMON_MESSAGE_H_
