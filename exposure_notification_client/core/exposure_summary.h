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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_SUMMARY_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_SUMMARY_H_

#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/util/ostream_overload.h"

namespace enclient {

ENCLIENT_OVERLOAD_VECTOR_OSTREAM_OPS

// The aggregate result of one check cycle as reported by the platform
// matching engine.
struct RawExposureSummary {
  int days_since_last_exposure = 0;
  int matched_key_count = 0;
  int maximum_risk_score = 0;
  int high_risk_attenuation_duration_minutes = 0;
  int medium_risk_attenuation_duration_minutes = 0;
  int low_risk_attenuation_duration_minutes = 0;
  int risk_score_sum = 0;

  friend bool operator==(const RawExposureSummary& a,
                         const RawExposureSummary& b) {
    return (a.days_since_last_exposure == b.days_since_last_exposure &&
            a.matched_key_count == b.matched_key_count &&
            a.maximum_risk_score == b.maximum_risk_score &&
            a.high_risk_attenuation_duration_minutes ==
                b.high_risk_attenuation_duration_minutes &&
            a.medium_risk_attenuation_duration_minutes ==
                b.medium_risk_attenuation_duration_minutes &&
            a.low_risk_attenuation_duration_minutes ==
                b.low_risk_attenuation_duration_minutes &&
            a.risk_score_sum == b.risk_score_sum);
  }

  friend std::ostream& operator<<(std::ostream& strm,
                                  const RawExposureSummary& raw) {
    return strm << "{" << raw.days_since_last_exposure << ", "
                << raw.matched_key_count << ", " << raw.maximum_risk_score
                << ", " << raw.high_risk_attenuation_duration_minutes << ", "
                << raw.medium_risk_attenuation_duration_minutes << ", "
                << raw.low_risk_attenuation_duration_minutes << ", "
                << raw.risk_score_sum << "}";
  }
};

// Detail of a single matched key. Fetched from the platform only when a
// check cycle changes the user visible status.
struct ExposureInfo {
  absl::Time date;
  int duration_minutes = 0;
  int attenuation_value = 0;
  std::vector<int> attenuation_durations_minutes;
  int transmission_risk_level = 0;
  int total_risk_score = 0;

  friend bool operator==(const ExposureInfo& a, const ExposureInfo& b) {
    return (a.date == b.date && a.duration_minutes == b.duration_minutes &&
            a.attenuation_value == b.attenuation_value &&
            a.attenuation_durations_minutes ==
                b.attenuation_durations_minutes &&
            a.transmission_risk_level == b.transmission_risk_level &&
            a.total_risk_score == b.total_risk_score);
  }

  friend bool operator!=(const ExposureInfo& a, const ExposureInfo& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& strm,
                                  const ExposureInfo& info) {
    return strm << "{" << info.date << ", " << info.duration_minutes << ", "
                << info.attenuation_value << ", "
                << info.attenuation_durations_minutes << ", "
                << info.transmission_risk_level << ", "
                << info.total_risk_score << "}";
  }
};

// The stored record of one check cycle. Summaries are appended to the
// summary store and never modified afterwards.
struct ExposureSummary {
  // Server date of the check.
  absl::Time date;
  // `date` moved back by the reported days since last exposure.
  absl::Time last_exposure_date;
  int matched_key_count = 0;
  int maximum_risk_score = 0;
  int high_risk_attenuation_duration_minutes = 0;
  int medium_risk_attenuation_duration_minutes = 0;
  int low_risk_attenuation_duration_minutes = 0;
  int risk_score_sum = 0;
  // Empty unless the check cycle triggered a notification.
  std::vector<ExposureInfo> exposure_infos;

  friend bool operator==(const ExposureSummary& a, const ExposureSummary& b) {
    return (a.date == b.date && a.last_exposure_date == b.last_exposure_date &&
            a.matched_key_count == b.matched_key_count &&
            a.maximum_risk_score == b.maximum_risk_score &&
            a.high_risk_attenuation_duration_minutes ==
                b.high_risk_attenuation_duration_minutes &&
            a.medium_risk_attenuation_duration_minutes ==
                b.medium_risk_attenuation_duration_minutes &&
            a.low_risk_attenuation_duration_minutes ==
                b.low_risk_attenuation_duration_minutes &&
            a.risk_score_sum == b.risk_score_sum &&
            a.exposure_infos == b.exposure_infos);
  }

  friend bool operator!=(const ExposureSummary& a, const ExposureSummary& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& strm,
                                  const ExposureSummary& summary) {
    return strm << "{" << summary.date << ", " << summary.last_exposure_date
                << ", " << summary.matched_key_count << ", "
                << summary.maximum_risk_score << ", "
                << summary.high_risk_attenuation_duration_minutes << ", "
                << summary.medium_risk_attenuation_duration_minutes << ", "
                << summary.low_risk_attenuation_duration_minutes << ", "
                << summary.risk_score_sum << ", " << summary.exposure_infos
                << "}";
  }
};

// A key from the platform's TEK history, uploaded after a positive
// diagnosis.
struct TemporaryExposureKey {
  std::string key_data;
  int rolling_start_number = 0;
  int rolling_period = 0;
  int transmission_risk_level = 0;

  friend bool operator==(const TemporaryExposureKey& a,
                         const TemporaryExposureKey& b) {
    return (a.key_data == b.key_data &&
            a.rolling_start_number == b.rolling_start_number &&
            a.rolling_period == b.rolling_period &&
            a.transmission_risk_level == b.transmission_risk_level);
  }

  friend std::ostream& operator<<(std::ostream& strm,
                                  const TemporaryExposureKey& key) {
    return strm << "{" << key.key_data.size() << " bytes, "
                << key.rolling_start_number << ", " << key.rolling_period
                << ", " << key.transmission_risk_level << "}";
  }
};

// Authorizes an upload. The server date of the token stamps the uploaded
// summaries.
struct DiagnosisToken {
  enum class Kind { kOtp, kCun };

  Kind kind = Kind::kOtp;
  std::string token;
  absl::Time server_date;
  // CUN only.
  std::string health_insurance_card;
  absl::optional<absl::Time> symptom_onset_date;
};

absl::Status ExposureSummaryToProto(const ExposureSummary& summary,
                                    ExposureSummaryProto* proto);

absl::StatusOr<ExposureSummary> ExposureSummaryFromProto(
    const ExposureSummaryProto& proto);

absl::StatusOr<ExposureInfo> ExposureInfoFromProto(
    const ExposureInfoProto& proto);

TemporaryExposureKeyProto TemporaryExposureKeyToProto(
    const TemporaryExposureKey& key);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_EXPOSURE_SUMMARY_H_
