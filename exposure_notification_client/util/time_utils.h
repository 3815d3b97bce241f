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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_UTIL_TIME_UTILS_H_
#define EXPOSURE_NOTIFICATION_CLIENT_UTIL_TIME_UTILS_H_

#include <string>

#include "absl/time/time.h"

namespace enclient {

// Days are fixed 24 hour units; no calendar or DST adjustment is applied.
inline constexpr absl::Duration kDay = absl::Hours(24);

// Converts a duration into whole days, truncating toward zero.
int ConvertDurationToDiscreteDays(absl::Duration duration);

// Returns `time` moved back by `days` whole days.
absl::Time SubtractDays(absl::Time time, int days);

// Formats `time` as an ISO yyyy-MM-dd date in UTC.
std::string FormatIsoDate(absl::Time time);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_UTIL_TIME_UTILS_H_
