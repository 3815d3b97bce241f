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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_APPLICATIONS_REPLAY_REPLAY_H_
#define EXPOSURE_NOTIFICATION_CLIENT_APPLICATIONS_REPLAY_REPLAY_H_

#include <memory>

#include "absl/status/statusor.h"
#include "exposure_notification_client/applications/replay/config.pb.h"
#include "exposure_notification_client/core/exposure_status_store.h"
#include "exposure_notification_client/core/summary_store.h"

namespace enclient {

// Replays the check cycles and the upload of `config` against the given
// stores, with the platform and the ingestion server simulated from the
// config.
absl::StatusOr<ReplayResultProto> RunReplay(
    const ReplayConfigProto& config,
    std::unique_ptr<ExposureStatusStore> status_store,
    std::unique_ptr<SummaryStore> summary_store);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_APPLICATIONS_REPLAY_REPLAY_H_
