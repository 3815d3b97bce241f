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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_STATUS_BUILDER_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_STATUS_BUILDER_H_

#include <memory>
#include <sstream>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "exposure_notification_client/port/deps/source_location.h"

namespace enclient {

// Wraps an absl::Status so that context can be streamed onto it before it is
// returned. Converts implicitly to absl::Status and absl::StatusOr<T>.
//
//   return StatusBuilder(status, ENCLIENT_LOC).LogError()
//          << "while committing " << exposure_status;
//
// Everything is a no-op on an OK status.
class ABSL_MUST_USE_RESULT StatusBuilder {
 public:
  StatusBuilder(const absl::Status& status, SourceLocation location)
      : status_(status), location_(location) {}
  StatusBuilder(absl::Status&& status, SourceLocation location)
      : status_(std::move(status)), location_(location) {}
  StatusBuilder(absl::StatusCode code, SourceLocation location)
      : status_(code, ""), location_(location) {}

  StatusBuilder(const StatusBuilder& other)
      : status_(other.status_), location_(other.location_) {
    if (other.extra_ != nullptr) {
      extra_ = absl::make_unique<Extra>(*other.extra_);
    }
  }
  StatusBuilder& operator=(const StatusBuilder& other) {
    status_ = other.status_;
    location_ = other.location_;
    extra_ = other.extra_ == nullptr ? nullptr
                                     : absl::make_unique<Extra>(*other.extra_);
    return *this;
  }
  StatusBuilder(StatusBuilder&&) = default;
  StatusBuilder& operator=(StatusBuilder&&) = default;

  // Streamed text goes before the original message, with no separator.
  StatusBuilder& SetPrepend() & { return SetJoin(Join::kPrepend); }
  StatusBuilder&& SetPrepend() && { return std::move(SetPrepend()); }

  // Logs the final status at `severity` when the builder is converted.
  StatusBuilder& Log(absl::LogSeverity severity) & {
    if (!status_.ok()) mutable_extra().log_severity = severity;
    return *this;
  }
  StatusBuilder&& Log(absl::LogSeverity severity) && {
    return std::move(Log(severity));
  }
  StatusBuilder& LogError() & { return Log(absl::LogSeverity::kError); }
  StatusBuilder&& LogError() && { return std::move(LogError()); }
  StatusBuilder& LogWarning() & { return Log(absl::LogSeverity::kWarning); }
  StatusBuilder&& LogWarning() && { return std::move(LogWarning()); }

  // Replaces the code, keeping the message and payloads.
  StatusBuilder& SetErrorCode(absl::StatusCode code) &;
  StatusBuilder&& SetErrorCode(absl::StatusCode code) && {
    return std::move(SetErrorCode(code));
  }

  template <typename T>
  StatusBuilder& operator<<(const T& value) & {
    if (!status_.ok()) mutable_extra().message << value;
    return *this;
  }
  template <typename T>
  StatusBuilder&& operator<<(const T& value) && {
    return std::move(*this << value);
  }

  bool ok() const { return status_.ok(); }
  absl::StatusCode code() const { return status_.code(); }

  // Each conversion builds the status, and logs it if requested.
  operator absl::Status() const& {  // NOLINT
    return StatusBuilder(*this).Build();
  }
  operator absl::Status() && { return std::move(*this).Build(); }  // NOLINT

  template <typename T>
  operator absl::StatusOr<T>() const& {  // NOLINT
    return StatusBuilder(*this).Build();
  }
  template <typename T>
  operator absl::StatusOr<T>() && {  // NOLINT
    return std::move(*this).Build();
  }

 private:
  enum class Join { kAnnotate, kPrepend };

  // Allocated on first use; most builders pass an OK status straight
  // through.
  struct Extra {
    Extra() = default;
    Extra(const Extra& other)
        : join(other.join), log_severity(other.log_severity) {
      message << other.message.str();
    }

    std::ostringstream message;
    Join join = Join::kAnnotate;
    absl::optional<absl::LogSeverity> log_severity;
  };

  StatusBuilder& SetJoin(Join join) {
    if (!status_.ok()) mutable_extra().join = join;
    return *this;
  }

  Extra& mutable_extra() {
    if (extra_ == nullptr) extra_ = absl::make_unique<Extra>();
    return *extra_;
  }

  absl::Status Build() &&;

  absl::Status status_;
  SourceLocation location_;
  std::unique_ptr<Extra> extra_;
};

// Starts a kFailedPrecondition error with an empty message.
StatusBuilder FailedPreconditionErrorBuilder(SourceLocation location);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_STATUS_BUILDER_H_
