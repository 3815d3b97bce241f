// Copyright 2020 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "exposure_notification_client/port/deps/logging.h"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace enclient {
namespace {

ABSL_CONST_INIT absl::Mutex log_file_mu(absl::kConstInit);
ABSL_CONST_INIT FILE* log_file ABSL_GUARDED_BY(log_file_mu) = nullptr;

std::atomic<int> vlog_level{0};

absl::string_view Basename(absl::string_view path) {
  const size_t slash = path.rfind('/');
  return slash == absl::string_view::npos ? path : path.substr(slash + 1);
}

void WriteLine(const std::string& line) {
  {
    absl::MutexLock l(&log_file_mu);
    if (log_file != nullptr) {
      std::fprintf(log_file, "%s\n", line.c_str());
      std::fflush(log_file);
    }
  }
  std::fprintf(stderr, "%s\n", line.c_str());
  std::fflush(stderr);
}

}  // namespace

void SetLogDestination(absl::string_view directory,
                       absl::string_view basename) {
  absl::MutexLock l(&log_file_mu);
  if (log_file != nullptr) {
    std::fclose(log_file);
    log_file = nullptr;
  }
  if (directory.empty()) return;
  const std::string path =
      absl::StrCat(directory, directory.back() == '/' ? "" : "/",
                   basename.empty() ? "enclient.log" : basename);
  log_file = std::fopen(path.c_str(), "a");
  if (log_file == nullptr) {
    std::fprintf(stderr, "Failed to open log file %s: %s\n", path.c_str(),
                 std::strerror(errno));
  }
}

void SetVLogLevel(int level) { vlog_level.store(level); }

int GetVLogLevel() { return vlog_level.load(); }

namespace logging_internal {

LogMessage::LogMessage(const char* file, int line, absl::LogSeverity severity)
    : severity_(severity) {
  stream_ << absl::FormatTime("%Y-%m-%d %H:%M:%E6S ", absl::Now(),
                              absl::LocalTimeZone())
          << absl::LogSeverityName(severity) << " " << Basename(file) << ":"
          << line << "] ";
}

LogMessage::~LogMessage() {
  Flush();
  if (severity_ == absl::LogSeverity::kFatal) std::abort();
}

void LogMessage::Flush() {
  if (flushed_) return;
  flushed_ = true;
  WriteLine(stream_.str());
}

LogMessageFatal::LogMessageFatal(const char* file, int line)
    : LogMessage(file, line, absl::LogSeverity::kFatal) {}

LogMessageFatal::LogMessageFatal(const char* file, int line,
                                 absl::string_view condition)
    : LogMessage(file, line, absl::LogSeverity::kFatal) {
  stream() << "Check failed: " << condition << " ";
}

LogMessageFatal::~LogMessageFatal() {
  Flush();
  std::abort();
}

}  // namespace logging_internal
}  // namespace enclient
