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

#include "exposure_notification_client/core/risk_policy.h"

#include "absl/strings/str_cat.h"
#include "exposure_notification_client/core/parse_text_proto.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/file_utils.h"

namespace enclient {

absl::StatusOr<RiskPolicy> CreateRiskPolicy(const RiskPolicyProto& proto) {
  if (proto.exposure_info_minimum_risk_score() < 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid value found for exposure_info_minimum_risk_score: ",
        proto.exposure_info_minimum_risk_score(), ". Must be non-negative."));
  }
  if (proto.teks_max_summary_count() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid value found for teks_max_summary_count: ",
                     proto.teks_max_summary_count(), ". Must be non-negative."));
  }
  if (proto.teks_max_info_count() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid value found for teks_max_info_count: ",
                     proto.teks_max_info_count(), ". Must be non-negative."));
  }

  RiskPolicy policy = {
      .minimum_risk_score = proto.exposure_info_minimum_risk_score(),
      .max_summary_count = proto.teks_max_summary_count(),
      .max_info_count = proto.teks_max_info_count()};
  return policy;
}

absl::StatusOr<RiskPolicy> FileRiskPolicyProvider::GetRiskPolicy() const {
  std::string contents;
  ENCLIENT_RETURN_IF_ERROR(file::GetContents(path_, &contents))
          .SetErrorCode(absl::StatusCode::kUnavailable)
      << "while reading risk policy";
  ENCLIENT_ASSIGN_OR_RETURN(
      const RiskPolicyProto proto, ParseTextProto<RiskPolicyProto>(contents),
      _.SetErrorCode(absl::StatusCode::kUnavailable) << "in " << path_);
  return CreateRiskPolicy(proto);
}

}  // namespace enclient
