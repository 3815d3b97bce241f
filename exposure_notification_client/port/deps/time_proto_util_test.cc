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

#include <limits>

#include "absl/time/time.h"
#include "exposure_notification_client/core/integral_types.h"
#include "exposure_notification_client/port/deps/status_matchers.h"
#include "gmock/gmock.h"
#include "google/protobuf/timestamp.pb.h"
#include "gtest/gtest.h"

namespace enclient {
namespace {

google::protobuf::Timestamp MakeTimestamp(int64 s, int32 ns) {
  google::protobuf::Timestamp proto;
  proto.set_seconds(s);
  proto.set_nanos(ns);
  return proto;
}

// 9999-12-31T23:59:59.999999999Z, the latest encodable time.
absl::Time MaxEncodableTime() {
  return absl::FromDateTime(9999, 12, 31, 23, 59, 59, absl::UTCTimeZone()) +
         absl::Nanoseconds(999999999);
}

// 0001-01-01T00:00:00Z, the earliest encodable time.
absl::Time MinEncodableTime() {
  return absl::FromDateTime(1, 1, 1, 0, 0, 0, absl::UTCTimeZone());
}

TEST(TimeProtoUtilTest, EncodesCheckDates) {
  const absl::Time epoch = absl::UnixEpoch();
  const struct {
    absl::Time t;
    int64 sec;
    int32 nsec;
  } kTestCases[] = {
      {epoch, 0, 0},
      {epoch + absl::Hours(24) * 10, 864000, 0},
      {epoch + absl::Seconds(123) + absl::Nanoseconds(456), 123, 456},
      {epoch - absl::Nanoseconds(5), -1, 999999995},
      {MinEncodableTime(), -62135596800, 0},
      {MaxEncodableTime(), 253402300799, 999999999},
  };

  for (const auto& tc : kTestCases) {
    google::protobuf::Timestamp proto;
    EXPECT_TRUE(IsEncodableAsTimestamp(tc.t)) << "t=" << tc.t;
    ENCLIENT_ASSERT_OK(EncodeTimestamp(tc.t, &proto));
    EXPECT_EQ(proto.seconds(), tc.sec) << "t=" << tc.t;
    EXPECT_EQ(proto.nanos(), tc.nsec) << "t=" << tc.t;
    EXPECT_THAT(DecodeTimestamp(proto), IsOkAndHolds(tc.t));
  }
}

TEST(TimeProtoUtilTest, TruncatesTowardInfinitePast) {
  const absl::Duration tick = absl::Nanoseconds(1) / 4;
  google::protobuf::Timestamp proto;
  ENCLIENT_ASSERT_OK(EncodeTimestamp(absl::UnixEpoch() - tick, &proto));
  EXPECT_EQ(proto.seconds(), -1);
  EXPECT_EQ(proto.nanos(), 999999999);
}

TEST(TimeProtoUtilTest, RejectsUnrepresentableTimes) {
  const absl::Time kTestCases[] = {
      MinEncodableTime() - absl::Nanoseconds(1),
      MaxEncodableTime() + absl::Nanoseconds(1),
      absl::InfinitePast(),
      absl::InfiniteFuture(),
  };

  for (const auto& t : kTestCases) {
    google::protobuf::Timestamp proto;
    EXPECT_FALSE(IsEncodableAsTimestamp(t)) << "t=" << t;
    EXPECT_THAT(EncodeTimestamp(t, &proto),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << "t=" << t;
  }
}

TEST(TimeProtoUtilTest, RejectsMalformedProtos) {
  const google::protobuf::Timestamp kTestCases[] = {
      MakeTimestamp(1, -1),
      MakeTimestamp(1, 999999999 + 1),
      MakeTimestamp(std::numeric_limits<int64>::lowest(), 0),
      MakeTimestamp(std::numeric_limits<int64>::max(), 0),
      MakeTimestamp(0, std::numeric_limits<int32>::max()),
  };

  for (const auto& proto : kTestCases) {
    EXPECT_THAT(DecodeTimestamp(proto),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << "proto=" << proto.DebugString();
  }
}

}  // namespace
}  // namespace enclient
