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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_ENGINE_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_ENGINE_H_

#include <ostream>

#include "absl/time/time.h"
#include "exposure_notification_client/core/exposure_status.h"
#include "exposure_notification_client/core/exposure_summary.h"
#include "exposure_notification_client/core/risk_policy.h"

// The exposure status state machine. Every function here is pure: the
// result depends only on the arguments, so a check cycle can be replayed
// given the same server date, raw summary, status and policy.

namespace enclient {

// Builds the summary record of a check cycle with no exposure infos.
// `last_exposure_date` is `server_date` moved back by
// `raw.days_since_last_exposure` days.
ExposureSummary BuildExposureSummary(absl::Time server_date,
                                     const RawExposureSummary& raw);

// Returns true if the summary holds values the matching engine should never
// report: negative counts or minutes, a last exposure after the check, or a
// check or last exposure date that a Timestamp cannot hold.
bool IsDegenerate(const ExposureSummary& summary);

// A summary qualifies if it is not degenerate, matched at least one key and
// its maximum risk score reaches the policy threshold. Nothing qualifies
// without a policy.
bool IsQualifying(const ExposureSummary& summary, const RiskPolicy* policy);

// Returns the status after `summary` is applied to `current`. Non-qualifying
// summaries and the Positive status leave the status unchanged. An Exposed
// status keeps the later of the two exposure dates and its acknowledgement.
ExposureStatus ComputeExposureStatus(const ExposureSummary& summary,
                                     const ExposureStatus& current,
                                     const RiskPolicy* policy);

// True for None -> Exposed, and for Exposed -> Exposed with a strictly later
// exposure date.
bool ShouldSendNotification(const ExposureStatus& old_status,
                            const ExposureStatus& new_status);

struct Evaluation {
  // Summary record of the cycle, always without infos.
  ExposureSummary summary;
  ExposureStatus new_status;
  // Whether the status change warrants a notification and therefore the
  // per key details.
  bool should_fetch_details;

  friend bool operator==(const Evaluation& a, const Evaluation& b) {
    return (a.summary == b.summary && a.new_status == b.new_status &&
            a.should_fetch_details == b.should_fetch_details);
  }

  friend std::ostream& operator<<(std::ostream& strm,
                                  const Evaluation& evaluation) {
    return strm << "{" << evaluation.summary << ", " << evaluation.new_status
                << ", " << evaluation.should_fetch_details << "}";
  }
};

// Runs the state machine for one check cycle.
Evaluation Evaluate(absl::Time server_date, const RawExposureSummary& raw,
                    const ExposureStatus& current, const RiskPolicy* policy);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_STATUS_ENGINE_H_
