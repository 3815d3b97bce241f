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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_TIME_PROTO_UTIL_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_TIME_PROTO_UTIL_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "google/protobuf/timestamp.pb.h"

namespace enclient {

// google.protobuf.Timestamp covers 0001-01-01T00:00:00Z through
// 9999-12-31T23:59:59.999999999Z. Times outside that range, including the
// infinite times, fail with kInvalidArgument. Sub-nanosecond precision is
// dropped by rounding down.
// True iff EncodeTimestamp accepts `time`.
bool IsEncodableAsTimestamp(absl::Time time);

absl::Status EncodeTimestamp(absl::Time time,
                             google::protobuf::Timestamp* timestamp);

// Fails with kInvalidArgument when `timestamp` is out of range or its nanos
// are not in [0, 1e9).
absl::StatusOr<absl::Time> DecodeTimestamp(
    const google::protobuf::Timestamp& timestamp);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_TIME_PROTO_UTIL_H_
