/*
 * Copyright 2020 Google LLC
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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_LOGGING_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_LOGGING_H_

#include <ostream>
#include <sstream>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/strings/string_view.h"

namespace enclient {

// Appends every later message to <directory>/<basename> as well as stderr.
// An empty directory closes the log file.
void SetLogDestination(absl::string_view directory, absl::string_view basename);

// VLOG(n) messages are emitted only for n <= level.
void SetVLogLevel(int level);
int GetVLogLevel();

namespace logging_internal {

// One log line. The text is collected in stream() and written when the
// message is destroyed, prefixed by time, severity, file and line.
class LogMessage {
 public:
  LogMessage(const char* file, int line, absl::LogSeverity severity);
  ~LogMessage();

  LogMessage(const LogMessage&) = delete;
  LogMessage& operator=(const LogMessage&) = delete;

  std::ostream& stream() { return stream_; }

 protected:
  void Flush();

 private:
  std::ostringstream stream_;
  const absl::LogSeverity severity_;
  bool flushed_ = false;
};

// Lets LOG_IF and CHECK discard the stream in a conditional expression; `&`
// binds looser than `<<` and tighter than `?:`.
class LogMessageVoidify {
 public:
  void operator&(const std::ostream&) {}
};

// A FATAL message. Aborts once written, so the destructor never returns.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char* file, int line);
  // Prefixes the message with the failed CHECK condition.
  LogMessageFatal(const char* file, int line, absl::string_view condition);
  ABSL_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

}  // namespace logging_internal
}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_LOGGING_H_
