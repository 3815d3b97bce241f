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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_STORE_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_STORE_H_

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "exposure_notification_client/core/exposure_status.h"

namespace enclient {

// The durable cell holding the user's current exposure status. A store starts
// out holding NoExposure.
class ExposureStatusStore {
 public:
  virtual absl::StatusOr<ExposureStatus> GetExposureStatus() const = 0;
  virtual absl::Status SetExposureStatus(const ExposureStatus& status) = 0;
  virtual ~ExposureStatusStore() = default;
};

std::unique_ptr<ExposureStatusStore> NewInMemoryExposureStatusStore();

// Persists the status as a serialized ExposureStatusProto at `path`. Each
// write replaces the file atomically.
std::unique_ptr<ExposureStatusStore> NewFileExposureStatusStore(
    absl::string_view path);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_STORE_H_
