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

#include "exposure_notification_client/core/upload_preparer.h"

#include <algorithm>

#include "exposure_notification_client/port/logging.h"
#include "exposure_notification_client/util/time_utils.h"

namespace enclient {

std::vector<ExposureSummary> SelectRecentSummaries(
    absl::Span<const ExposureSummary> summaries, int max_summary_count) {
  std::vector<ExposureSummary> recent(summaries.begin(), summaries.end());
  std::stable_sort(recent.begin(), recent.end(),
                   [](const ExposureSummary& a, const ExposureSummary& b) {
                     return a.date > b.date;
                   });
  const size_t cap = std::max(max_summary_count, 0);
  if (recent.size() > cap) recent.resize(cap);
  return recent;
}

std::vector<RankedInfo> RankAndCapInfos(
    absl::Span<const ExposureSummary> summaries, int max_info_count) {
  std::vector<RankedInfo> ranked;
  for (int i = 0; i < summaries.size(); ++i) {
    for (const ExposureInfo& info : summaries[i].exposure_infos) {
      ranked.push_back({.summary_index = i, .info = info});
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedInfo& a, const RankedInfo& b) {
                     if (a.info.total_risk_score != b.info.total_risk_score) {
                       return a.info.total_risk_score > b.info.total_risk_score;
                     }
                     return a.info.date < b.info.date;
                   });
  const size_t cap = std::max(max_info_count, 0);
  if (ranked.size() > cap) ranked.resize(cap);
  return ranked;
}

std::vector<ExposureSummary> RebuildSummaries(
    absl::Span<const ExposureSummary> summaries,
    absl::Span<const RankedInfo> ranked_infos) {
  std::vector<ExposureSummary> rebuilt(summaries.begin(), summaries.end());
  for (ExposureSummary& summary : rebuilt) {
    summary.exposure_infos.clear();
  }
  for (const RankedInfo& ranked : ranked_infos) {
    DCHECK_GE(ranked.summary_index, 0);
    DCHECK_LT(ranked.summary_index, rebuilt.size());
    rebuilt[ranked.summary_index].exposure_infos.push_back(ranked.info);
  }
  return rebuilt;
}

UploadExposureSummary ToUploadExposureSummary(const ExposureSummary& summary,
                                              absl::Time upload_server_date) {
  UploadExposureSummary upload;
  upload.set_date(FormatIsoDate(summary.date));
  upload.set_matched_key_count(summary.matched_key_count);
  upload.set_days_since_last_exposure(std::max(
      0, ConvertDurationToDiscreteDays(upload_server_date -
                                       summary.last_exposure_date)));
  upload.add_attenuation_durations(
      summary.high_risk_attenuation_duration_minutes);
  upload.add_attenuation_durations(
      summary.medium_risk_attenuation_duration_minutes);
  upload.add_attenuation_durations(
      summary.low_risk_attenuation_duration_minutes);
  upload.set_maximum_risk_score(summary.maximum_risk_score);
  upload.set_risk_score_sum(summary.risk_score_sum);
  for (const ExposureInfo& info : summary.exposure_infos) {
    UploadExposureInfo* upload_info = upload.add_exposure_info();
    upload_info->set_date(FormatIsoDate(info.date));
    upload_info->set_duration(info.duration_minutes);
    upload_info->set_attenuation_value(info.attenuation_value);
    for (const int minutes : info.attenuation_durations_minutes) {
      upload_info->add_attenuation_durations(minutes);
    }
    upload_info->set_transmission_risk_level(info.transmission_risk_level);
    upload_info->set_total_risk_score(info.total_risk_score);
  }
  return upload;
}

std::vector<UploadExposureSummary> PrepareForUpload(
    absl::Span<const ExposureSummary> summaries, const RiskPolicy& policy,
    absl::Time upload_server_date) {
  const std::vector<ExposureSummary> recent =
      SelectRecentSummaries(summaries, policy.max_summary_count);
  const std::vector<RankedInfo> ranked =
      RankAndCapInfos(recent, policy.max_info_count);
  const std::vector<ExposureSummary> rebuilt =
      RebuildSummaries(recent, ranked);

  std::vector<UploadExposureSummary> upload;
  upload.reserve(rebuilt.size());
  for (const ExposureSummary& summary : rebuilt) {
    upload.push_back(ToUploadExposureSummary(summary, upload_server_date));
  }
  VLOG(1) << "Prepared " << upload.size() << " of " << summaries.size()
          << " summaries with " << ranked.size() << " infos for upload";
  return upload;
}

}  // namespace enclient
