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

namespace enclient {

int ConvertDurationToDiscreteDays(absl::Duration duration) {
  absl::Duration remainder;
  return static_cast<int>(absl::IDivDuration(duration, kDay, &remainder));
}

absl::Time SubtractDays(absl::Time time, int days) {
  return time - kDay * days;
}

std::string FormatIsoDate(absl::Time time) {
  return absl::FormatTime("%Y-%m-%d", time, absl::UTCTimeZone());
}

}  // namespace enclient
