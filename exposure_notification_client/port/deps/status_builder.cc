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

#include "exposure_notification_client/port/deps/status_builder.h"

#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "exposure_notification_client/port/deps/logging.h"

namespace enclient {
namespace {

// Returns a status with `code` and `message` that carries the payloads of
// `original`.
absl::Status Rebuild(const absl::Status& original, absl::StatusCode code,
                     absl::string_view message) {
  absl::Status status(code, message);
  original.ForEachPayload(
      [&status](absl::string_view type_url, const absl::Cord& payload) {
        status.SetPayload(type_url, payload);
      });
  return status;
}

}  // namespace

StatusBuilder& StatusBuilder::SetErrorCode(absl::StatusCode code) & {
  status_ = Rebuild(status_, code, status_.message());
  return *this;
}

absl::Status StatusBuilder::Build() && {
  if (extra_ == nullptr) return std::move(status_);

  const std::string extra_message = extra_->message.str();
  if (!extra_message.empty()) {
    std::string message;
    if (status_.message().empty()) {
      message = extra_message;
    } else {
      switch (extra_->join) {
        case Join::kAnnotate:
          message = absl::StrCat(status_.message(), "; ", extra_message);
          break;
        case Join::kPrepend:
          message = absl::StrCat(extra_message, status_.message());
          break;
      }
    }
    status_ = Rebuild(status_, status_.code(), message);
  }
  if (extra_->log_severity.has_value()) {
    logging_internal::LogMessage(location_.file_name(), location_.line(),
                                 *extra_->log_severity)
            .stream()
        << status_;
  }
  extra_ = nullptr;
  return std::move(status_);
}

StatusBuilder FailedPreconditionErrorBuilder(SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kFailedPrecondition, location);
}

}  // namespace enclient
