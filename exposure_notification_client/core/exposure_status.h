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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_H_

#include <ostream>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/variant.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"

namespace enclient {

// No qualifying exposure has been recorded.
struct NoExposure {
  friend bool operator==(const NoExposure&, const NoExposure&) { return true; }
  friend bool operator!=(const NoExposure&, const NoExposure&) {
    return false;
  }
  friend std::ostream& operator<<(std::ostream& strm, const NoExposure&) {
    return strm << "None";
  }
};

// At least one qualifying exposure has been recorded. `last_exposure_date`
// never decreases while the status stays Exposed.
struct Exposed {
  absl::Time last_exposure_date;
  bool acknowledged = false;

  friend bool operator==(const Exposed& a, const Exposed& b) {
    return (a.last_exposure_date == b.last_exposure_date &&
            a.acknowledged == b.acknowledged);
  }
  friend bool operator!=(const Exposed& a, const Exposed& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& strm, const Exposed& exposed) {
    return strm << "Exposed{" << exposed.last_exposure_date << ", "
                << (exposed.acknowledged ? "acknowledged" : "unacknowledged")
                << "}";
  }
};

// The user uploaded their keys after a positive diagnosis. Check cycles never
// leave this state.
struct Positive {
  friend bool operator==(const Positive&, const Positive&) { return true; }
  friend bool operator!=(const Positive&, const Positive&) { return false; }
  friend std::ostream& operator<<(std::ostream& strm, const Positive&) {
    return strm << "Positive";
  }
};

using ExposureStatus = absl::variant<NoExposure, Exposed, Positive>;

std::ostream& operator<<(std::ostream& strm, const ExposureStatus& status);

absl::Status ExposureStatusToProto(const ExposureStatus& status,
                                   ExposureStatusProto* proto);

// Returns InvalidArgument for an unspecified kind or a malformed date.
absl::StatusOr<ExposureStatus> ExposureStatusFromProto(
    const ExposureStatusProto& proto);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_H_
