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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_RECORD_SUMMARY_STORE_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_RECORD_SUMMARY_STORE_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "exposure_notification_client/core/summary_store.h"

namespace enclient {

// Opens a SummaryStore whose summaries are kept as ExposureSummaryProto
// records in the riegeli file at `path`. Existing records are loaded; a
// missing file is an empty history. Every write replaces the whole file.
// Countries of interest and the last processed chunk are not persisted.
absl::StatusOr<std::unique_ptr<SummaryStore>> OpenRecordSummaryStore(
    absl::string_view path);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_RECORD_SUMMARY_STORE_H_
