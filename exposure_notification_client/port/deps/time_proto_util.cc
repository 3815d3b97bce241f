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

#include "exposure_notification_client/port/deps/time_proto_util.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "exposure_notification_client/core/integral_types.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "google/protobuf/timestamp.pb.h"

namespace enclient {
namespace {

constexpr int64 kEarliestSeconds = -62135596800;  // 0001-01-01T00:00:00Z
constexpr int64 kLatestSeconds = 253402300799;    // 9999-12-31T23:59:59Z
constexpr int32 kNanosPerSecond = 1000000000;

absl::Status CheckRange(int64 seconds, int32 nanos) {
  if (seconds < kEarliestSeconds || seconds > kLatestSeconds) {
    return absl::InvalidArgumentError(
        absl::StrCat("Timestamp seconds out of range: ", seconds));
  }
  if (nanos < 0 || nanos >= kNanosPerSecond) {
    return absl::InvalidArgumentError(
        absl::StrCat("Timestamp nanos out of range: ", nanos));
  }
  return absl::OkStatus();
}

}  // namespace

bool IsEncodableAsTimestamp(absl::Time time) {
  if (time == absl::InfiniteFuture() || time == absl::InfinitePast()) {
    return false;
  }
  const int64 seconds = absl::ToUnixSeconds(time);
  return seconds >= kEarliestSeconds && seconds <= kLatestSeconds;
}

absl::Status EncodeTimestamp(absl::Time time,
                             google::protobuf::Timestamp* timestamp) {
  if (time == absl::InfiniteFuture() || time == absl::InfinitePast()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot encode ", absl::FormatTime(time), " as a Timestamp."));
  }
  // ToUnixSeconds floors, so the remainder is non-negative.
  const int64 seconds = absl::ToUnixSeconds(time);
  const int32 nanos = static_cast<int32>(absl::ToInt64Nanoseconds(
      time - absl::FromUnixSeconds(seconds)));
  ENCLIENT_RETURN_IF_ERROR(CheckRange(seconds, nanos));
  timestamp->set_seconds(seconds);
  timestamp->set_nanos(nanos);
  return absl::OkStatus();
}

absl::StatusOr<absl::Time> DecodeTimestamp(
    const google::protobuf::Timestamp& timestamp) {
  ENCLIENT_RETURN_IF_ERROR(CheckRange(timestamp.seconds(), timestamp.nanos()));
  return absl::FromUnixSeconds(timestamp.seconds()) +
         absl::Nanoseconds(timestamp.nanos());
}

}  // namespace enclient
