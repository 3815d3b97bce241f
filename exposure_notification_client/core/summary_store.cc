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

#include "exposure_notification_client/core/summary_store.h"

#include <utility>

#include "absl/memory/memory.h"
#include "absl/synchronization/mutex.h"

namespace enclient {
namespace {

class InMemorySummaryStore : public SummaryStore {
 public:
  absl::Status AddSummary(const ExposureSummary& summary) override {
    absl::MutexLock l(&mu_);
    summaries_.push_back(summary);
    return absl::OkStatus();
  }

  absl::StatusOr<std::vector<ExposureSummary>> GetSummaries() const override {
    absl::MutexLock l(&mu_);
    return summaries_;
  }

  absl::Status ResetSummaries() override {
    absl::MutexLock l(&mu_);
    summaries_.clear();
    return absl::OkStatus();
  }

  std::vector<std::string> GetCountriesOfInterest() const override {
    absl::MutexLock l(&mu_);
    return countries_of_interest_;
  }

  void SetCountriesOfInterest(std::vector<std::string> countries) override {
    absl::MutexLock l(&mu_);
    countries_of_interest_ = std::move(countries);
  }

  absl::optional<int64> GetLastProcessedChunk() const override {
    absl::MutexLock l(&mu_);
    return last_processed_chunk_;
  }

  void SetLastProcessedChunk(absl::optional<int64> chunk) override {
    absl::MutexLock l(&mu_);
    last_processed_chunk_ = chunk;
  }

 private:
  mutable absl::Mutex mu_;
  std::vector<ExposureSummary> summaries_ ABSL_GUARDED_BY(mu_);
  std::vector<std::string> countries_of_interest_ ABSL_GUARDED_BY(mu_);
  absl::optional<int64> last_processed_chunk_ ABSL_GUARDED_BY(mu_);
};

}  // namespace

std::unique_ptr<SummaryStore> NewInMemorySummaryStore() {
  return absl::make_unique<InMemorySummaryStore>();
}

}  // namespace enclient
