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

#include "exposure_notification_client/util/time_utils.h"

#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace enclient {
namespace {

TEST(TimeUtilsTest, ConvertDurationToDiscreteDays) {
  EXPECT_EQ(ConvertDurationToDiscreteDays(absl::ZeroDuration()), 0);
  EXPECT_EQ(ConvertDurationToDiscreteDays(absl::Hours(23)), 0);
  EXPECT_EQ(ConvertDurationToDiscreteDays(absl::Hours(24)), 1);
  EXPECT_EQ(ConvertDurationToDiscreteDays(absl::Hours(24 * 8 + 5)), 8);
  EXPECT_EQ(ConvertDurationToDiscreteDays(-absl::Hours(30)), -1);
}

TEST(TimeUtilsTest, SubtractDays) {
  const absl::Time day10 = absl::UnixEpoch() + kDay * 10;
  EXPECT_EQ(SubtractDays(day10, 2), absl::UnixEpoch() + kDay * 8);
  EXPECT_EQ(SubtractDays(day10, 0), day10);
}

TEST(TimeUtilsTest, SubtractDaysAcrossMonthBoundary) {
  const absl::Time march_2 =
      absl::FromCivil(absl::CivilDay(2020, 3, 2), absl::UTCTimeZone());
  EXPECT_EQ(FormatIsoDate(SubtractDays(march_2, 3)), "2020-02-28");
}

TEST(TimeUtilsTest, FormatIsoDate) {
  EXPECT_EQ(FormatIsoDate(absl::UnixEpoch()), "1970-01-01");
  EXPECT_EQ(FormatIsoDate(absl::UnixEpoch() + kDay * 10 + absl::Hours(23)),
            "1970-01-11");
}

}  // namespace
}  // namespace enclient
