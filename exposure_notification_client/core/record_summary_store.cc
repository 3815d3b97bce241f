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

#include "exposure_notification_client/core/record_summary_store.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/file_utils.h"
#include "exposure_notification_client/port/logging.h"
#include "exposure_notification_client/util/records.h"

namespace enclient {
namespace {

absl::StatusOr<std::vector<ExposureSummary>> ReadSummaries(
    const std::string& path) {
  std::vector<ExposureSummary> summaries;
  auto reader = MakeRecordReader(path);
  ExposureSummaryProto proto;
  while (reader.ReadRecord(proto)) {
    ENCLIENT_ASSIGN_OR_RETURN(ExposureSummary summary,
                              ExposureSummaryFromProto(proto),
                              _ << "in record " << summaries.size());
    summaries.push_back(std::move(summary));
  }
  if (!reader.Close()) {
    return absl::DataLossError(absl::StrCat(
        "Failed to read summaries from ", path, ": ",
        reader.status().message()));
  }
  return summaries;
}

absl::Status WriteSummaries(const std::string& path,
                            absl::Span<const ExposureSummary> summaries) {
  std::vector<ExposureSummaryProto> protos(summaries.size());
  for (int i = 0; i < summaries.size(); ++i) {
    ENCLIENT_RETURN_IF_ERROR(ExposureSummaryToProto(summaries[i], &protos[i]))
        << "while encoding " << summaries[i];
  }
  const std::string temp_path = absl::StrCat(path, ".tmp");
  auto writer = MakeRecordWriter(temp_path, /*parallelism=*/0);
  for (const ExposureSummaryProto& proto : protos) {
    if (!writer.WriteRecord(proto)) break;
  }
  if (!writer.Close()) {
    return absl::UnavailableError(absl::StrCat(
        "Failed to write summaries to ", temp_path, ": ",
        writer.status().message()));
  }
  return file::Rename(temp_path, path);
}

class RecordSummaryStore : public SummaryStore {
 public:
  RecordSummaryStore(std::string path, std::vector<ExposureSummary> summaries)
      : path_(std::move(path)), summaries_(std::move(summaries)) {}

  absl::Status AddSummary(const ExposureSummary& summary) override {
    absl::MutexLock l(&mu_);
    std::vector<ExposureSummary> summaries = summaries_;
    summaries.push_back(summary);
    ENCLIENT_RETURN_IF_ERROR(WriteSummaries(path_, summaries)).LogError()
        << "while appending summary";
    summaries_ = std::move(summaries);
    return absl::OkStatus();
  }

  absl::StatusOr<std::vector<ExposureSummary>> GetSummaries() const override {
    absl::MutexLock l(&mu_);
    return summaries_;
  }

  absl::Status ResetSummaries() override {
    absl::MutexLock l(&mu_);
    ENCLIENT_RETURN_IF_ERROR(file::Delete(path_)).LogError()
        << "while resetting summaries";
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
  const std::string path_;
  mutable absl::Mutex mu_;
  std::vector<ExposureSummary> summaries_ ABSL_GUARDED_BY(mu_);
  std::vector<std::string> countries_of_interest_ ABSL_GUARDED_BY(mu_);
  absl::optional<int64> last_processed_chunk_ ABSL_GUARDED_BY(mu_);
};

}  // namespace

absl::StatusOr<std::unique_ptr<SummaryStore>> OpenRecordSummaryStore(
    absl::string_view path) {
  std::string file_path(path);
  std::vector<ExposureSummary> summaries;
  if (std::filesystem::exists(file_path)) {
    ENCLIENT_ASSIGN_OR_RETURN(summaries, ReadSummaries(file_path));
  }
  VLOG(1) << "Loaded " << summaries.size() << " summaries from " << file_path;
  return std::unique_ptr<SummaryStore>(absl::make_unique<RecordSummaryStore>(
      std::move(file_path), std::move(summaries)));
}

}  // namespace enclient
