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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_SUMMARY_STORE_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_SUMMARY_STORE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "exposure_notification_client/core/exposure_summary.h"
#include "exposure_notification_client/core/integral_types.h"

namespace enclient {

// Exposure reporting history: the append-only list of check cycle summaries
// plus the key download bookkeeping. Implementations are thread-safe.
class SummaryStore {
 public:
  virtual absl::Status AddSummary(const ExposureSummary& summary) = 0;
  // Returns the summaries in the order they were added.
  virtual absl::StatusOr<std::vector<ExposureSummary>> GetSummaries()
      const = 0;
  virtual absl::Status ResetSummaries() = 0;

  // Country codes whose keys are downloaded in addition to the home
  // country's.
  virtual std::vector<std::string> GetCountriesOfInterest() const = 0;
  virtual void SetCountriesOfInterest(std::vector<std::string> countries) = 0;

  // Index of the last key file chunk that was matched, if any.
  virtual absl::optional<int64> GetLastProcessedChunk() const = 0;
  virtual void SetLastProcessedChunk(absl::optional<int64> chunk) = 0;

  virtual ~SummaryStore() = default;
};

std::unique_ptr<SummaryStore> NewInMemorySummaryStore();

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_SUMMARY_STORE_H_
