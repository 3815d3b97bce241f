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

#include "exposure_notification_client/core/exposure_status_engine.h"

#include <algorithm>

#include "exposure_notification_client/port/deps/time_proto_util.h"
#include "exposure_notification_client/port/logging.h"
#include "exposure_notification_client/util/time_utils.h"

namespace enclient {
namespace {

// Applies a qualifying exposure to each kind of status.
struct ApplyExposure {
  ExposureStatus operator()(const NoExposure&) const {
    return Exposed{.last_exposure_date = last_exposure_date,
                   .acknowledged = false};
  }
  ExposureStatus operator()(const Exposed& exposed) const {
    return Exposed{.last_exposure_date = std::max(exposed.last_exposure_date,
                                                  last_exposure_date),
                   .acknowledged = exposed.acknowledged};
  }
  ExposureStatus operator()(const Positive& positive) const { return positive; }

  absl::Time last_exposure_date;
};

// Decides, from the previous status, whether `new_status` is news to the user.
struct IsNewExposure {
  bool operator()(const NoExposure&) const {
    return absl::holds_alternative<Exposed>(new_status);
  }
  bool operator()(const Exposed& old_exposed) const {
    const Exposed* new_exposed = absl::get_if<Exposed>(&new_status);
    return new_exposed != nullptr &&
           new_exposed->last_exposure_date > old_exposed.last_exposure_date;
  }
  bool operator()(const Positive&) const { return false; }

  const ExposureStatus& new_status;
};

}  // namespace

ExposureSummary BuildExposureSummary(absl::Time server_date,
                                     const RawExposureSummary& raw) {
  ExposureSummary summary;
  summary.date = server_date;
  summary.last_exposure_date =
      SubtractDays(server_date, raw.days_since_last_exposure);
  summary.matched_key_count = raw.matched_key_count;
  summary.maximum_risk_score = raw.maximum_risk_score;
  summary.high_risk_attenuation_duration_minutes =
      raw.high_risk_attenuation_duration_minutes;
  summary.medium_risk_attenuation_duration_minutes =
      raw.medium_risk_attenuation_duration_minutes;
  summary.low_risk_attenuation_duration_minutes =
      raw.low_risk_attenuation_duration_minutes;
  summary.risk_score_sum = raw.risk_score_sum;
  return summary;
}

bool IsDegenerate(const ExposureSummary& summary) {
  return !IsEncodableAsTimestamp(summary.date) ||
         !IsEncodableAsTimestamp(summary.last_exposure_date) ||
         summary.last_exposure_date > summary.date ||
         summary.matched_key_count < 0 ||
         summary.high_risk_attenuation_duration_minutes < 0 ||
         summary.medium_risk_attenuation_duration_minutes < 0 ||
         summary.low_risk_attenuation_duration_minutes < 0;
}

bool IsQualifying(const ExposureSummary& summary, const RiskPolicy* policy) {
  if (policy == nullptr || IsDegenerate(summary)) return false;
  return summary.matched_key_count > 0 &&
         summary.maximum_risk_score >= policy->minimum_risk_score;
}

ExposureStatus ComputeExposureStatus(const ExposureSummary& summary,
                                     const ExposureStatus& current,
                                     const RiskPolicy* policy) {
  if (!IsQualifying(summary, policy)) return current;
  return absl::visit(ApplyExposure{summary.last_exposure_date}, current);
}

bool ShouldSendNotification(const ExposureStatus& old_status,
                            const ExposureStatus& new_status) {
  return absl::visit(IsNewExposure{new_status}, old_status);
}

Evaluation Evaluate(absl::Time server_date, const RawExposureSummary& raw,
                    const ExposureStatus& current, const RiskPolicy* policy) {
  Evaluation evaluation = {.summary = BuildExposureSummary(server_date, raw),
                           .new_status = current,
                           .should_fetch_details = false};
  if (IsDegenerate(evaluation.summary)) {
    LOG(WARNING) << "Ignoring degenerate exposure summary " << raw
                 << " reported at " << server_date;
    return evaluation;
  }
  evaluation.new_status =
      ComputeExposureStatus(evaluation.summary, current, policy);
  evaluation.should_fetch_details =
      ShouldSendNotification(current, evaluation.new_status);
  VLOG(1) << "Exposure status " << current << " -> " << evaluation.new_status
          << (evaluation.should_fetch_details ? ", notifying" : "");
  return evaluation;
}

}  // namespace enclient
