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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_NOTIFICATION_CLIENT_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_NOTIFICATION_CLIENT_H_

#include <functional>
#include <vector>

#include "absl/status/statusor.h"
#include "exposure_notification_client/core/exposure_status.h"
#include "exposure_notification_client/core/exposure_summary.h"

namespace enclient {

// Fetches the per key details of the check cycle being processed.
using InfoFetcher =
    std::function<absl::StatusOr<std::vector<ExposureInfo>>()>;

// The platform proximity matching engine.
class ExposureNotificationClient {
 public:
  // Returns the device's own temporary exposure keys for upload.
  virtual absl::StatusOr<std::vector<TemporaryExposureKey>>
  RequestTekHistory() = 0;
  virtual ~ExposureNotificationClient() = default;
};

// Tells the user about a new or more recent exposure.
class ExposureNotifier {
 public:
  virtual void NotifyExposure(const ExposureStatus& status) = 0;
  virtual ~ExposureNotifier() = default;
};

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_NOTIFICATION_CLIENT_H_
