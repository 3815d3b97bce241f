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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_RISK_POLICY_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_RISK_POLICY_H_

#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"

namespace enclient {

// Snapshot of the settings that gate status changes and bound uploads.
struct RiskPolicy {
  // A summary whose maximum risk score is below this never changes status.
  int minimum_risk_score;
  // Upload keeps at most this many of the most recent summaries.
  int max_summary_count;
  // Upload keeps at most this many infos across all kept summaries.
  int max_info_count;

  friend bool operator==(const RiskPolicy& a, const RiskPolicy& b) {
    return (a.minimum_risk_score == b.minimum_risk_score &&
            a.max_summary_count == b.max_summary_count &&
            a.max_info_count == b.max_info_count);
  }

  friend bool operator!=(const RiskPolicy& a, const RiskPolicy& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& strm,
                                  const RiskPolicy& policy) {
    return strm << "{" << policy.minimum_risk_score << ", "
                << policy.max_summary_count << ", " << policy.max_info_count
                << "}";
  }
};

absl::StatusOr<RiskPolicy> CreateRiskPolicy(const RiskPolicyProto& proto);

// Supplies the current risk policy, or an error if the configuration is not
// available.
class RiskPolicyProvider {
 public:
  virtual absl::StatusOr<RiskPolicy> GetRiskPolicy() const = 0;
  virtual ~RiskPolicyProvider() = default;
};

// Always returns the same policy, or the same error.
class StaticRiskPolicyProvider : public RiskPolicyProvider {
 public:
  explicit StaticRiskPolicyProvider(absl::StatusOr<RiskPolicy> policy)
      : policy_(std::move(policy)) {}

  absl::StatusOr<RiskPolicy> GetRiskPolicy() const override { return policy_; }

 private:
  const absl::StatusOr<RiskPolicy> policy_;
};

// Reads a RiskPolicyProto text file on every call, so edits to the file take
// effect on the next check cycle.
class FileRiskPolicyProvider : public RiskPolicyProvider {
 public:
  explicit FileRiskPolicyProvider(absl::string_view path) : path_(path) {}

  absl::StatusOr<RiskPolicy> GetRiskPolicy() const override;

 private:
  const std::string path_;
};

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_RISK_POLICY_H_
