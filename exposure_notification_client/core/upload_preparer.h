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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_UPLOAD_PREPARER_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_UPLOAD_PREPARER_H_

#include <ostream>
#include <vector>

#include "absl/time/time.h"
#include "absl/types/span.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/core/exposure_summary.h"
#include "exposure_notification_client/core/risk_policy.h"

// Selects the part of the local exposure history that is uploaded after a
// positive diagnosis. The history is capped twice: first to the most recent
// summaries, then to the highest risk infos across those summaries.

namespace enclient {

// An exposure info tagged with the position of its summary in the output of
// SelectRecentSummaries.
struct RankedInfo {
  int summary_index;
  ExposureInfo info;

  friend bool operator==(const RankedInfo& a, const RankedInfo& b) {
    return a.summary_index == b.summary_index && a.info == b.info;
  }

  friend std::ostream& operator<<(std::ostream& strm, const RankedInfo& ranked) {
    return strm << "{" << ranked.summary_index << ", " << ranked.info << "}";
  }
};

// Returns the `max_summary_count` most recent summaries, most recent first.
// Summaries with equal dates keep their stored order.
std::vector<ExposureSummary> SelectRecentSummaries(
    absl::Span<const ExposureSummary> summaries, int max_summary_count);

// Ranks the infos of all `summaries` by total risk score, highest first, and
// among equal scores by date, oldest first. Returns the first
// `max_info_count`.
std::vector<RankedInfo> RankAndCapInfos(
    absl::Span<const ExposureSummary> summaries, int max_info_count);

// Returns `summaries` with each summary's infos replaced by the ranked infos
// tagged with its index, in ranked order. Summaries left without infos are
// kept.
std::vector<ExposureSummary> RebuildSummaries(
    absl::Span<const ExposureSummary> summaries,
    absl::Span<const RankedInfo> ranked_infos);

// Converts a summary to its upload form. `days_since_last_exposure` counts
// whole days from the last exposure to `upload_server_date`.
UploadExposureSummary ToUploadExposureSummary(const ExposureSummary& summary,
                                              absl::Time upload_server_date);

// Runs the three passes above and converts the result.
std::vector<UploadExposureSummary> PrepareForUpload(
    absl::Span<const ExposureSummary> summaries, const RiskPolicy& policy,
    absl::Time upload_server_date);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_UPLOAD_PREPARER_H_
