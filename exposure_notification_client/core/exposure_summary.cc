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

#include "exposure_notification_client/core/exposure_summary.h"

#include <utility>

#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/deps/time_proto_util.h"

namespace enclient {
namespace {

absl::Status ExposureInfoToProto(const ExposureInfo& info,
                                 ExposureInfoProto* proto) {
  ENCLIENT_RETURN_IF_ERROR(
      EncodeTimestamp(info.date, proto->mutable_date()))
      << "while encoding exposure info date";
  proto->set_duration_minutes(info.duration_minutes);
  proto->set_attenuation_value(info.attenuation_value);
  for (const int minutes : info.attenuation_durations_minutes) {
    proto->add_attenuation_durations_minutes(minutes);
  }
  proto->set_transmission_risk_level(info.transmission_risk_level);
  proto->set_total_risk_score(info.total_risk_score);
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<ExposureInfo> ExposureInfoFromProto(
    const ExposureInfoProto& proto) {
  ExposureInfo info;
  ENCLIENT_ASSIGN_OR_RETURN(info.date, DecodeTimestamp(proto.date()));
  info.duration_minutes = proto.duration_minutes();
  info.attenuation_value = proto.attenuation_value();
  info.attenuation_durations_minutes.assign(
      proto.attenuation_durations_minutes().begin(),
      proto.attenuation_durations_minutes().end());
  info.transmission_risk_level = proto.transmission_risk_level();
  info.total_risk_score = proto.total_risk_score();
  return info;
}

absl::Status ExposureSummaryToProto(const ExposureSummary& summary,
                                    ExposureSummaryProto* proto) {
  ENCLIENT_RETURN_IF_ERROR(
      EncodeTimestamp(summary.date, proto->mutable_date()))
      << "while encoding summary date";
  ENCLIENT_RETURN_IF_ERROR(EncodeTimestamp(
      summary.last_exposure_date, proto->mutable_last_exposure_date()))
      << "while encoding last exposure date";
  proto->set_matched_key_count(summary.matched_key_count);
  proto->set_maximum_risk_score(summary.maximum_risk_score);
  proto->set_high_risk_attenuation_duration_minutes(
      summary.high_risk_attenuation_duration_minutes);
  proto->set_medium_risk_attenuation_duration_minutes(
      summary.medium_risk_attenuation_duration_minutes);
  proto->set_low_risk_attenuation_duration_minutes(
      summary.low_risk_attenuation_duration_minutes);
  proto->set_risk_score_sum(summary.risk_score_sum);
  for (const ExposureInfo& info : summary.exposure_infos) {
    ENCLIENT_RETURN_IF_ERROR(
        ExposureInfoToProto(info, proto->add_exposure_infos()));
  }
  return absl::OkStatus();
}

absl::StatusOr<ExposureSummary> ExposureSummaryFromProto(
    const ExposureSummaryProto& proto) {
  ExposureSummary summary;
  ENCLIENT_ASSIGN_OR_RETURN(summary.date, DecodeTimestamp(proto.date()));
  ENCLIENT_ASSIGN_OR_RETURN(summary.last_exposure_date,
                            DecodeTimestamp(proto.last_exposure_date()));
  summary.matched_key_count = proto.matched_key_count();
  summary.maximum_risk_score = proto.maximum_risk_score();
  summary.high_risk_attenuation_duration_minutes =
      proto.high_risk_attenuation_duration_minutes();
  summary.medium_risk_attenuation_duration_minutes =
      proto.medium_risk_attenuation_duration_minutes();
  summary.low_risk_attenuation_duration_minutes =
      proto.low_risk_attenuation_duration_minutes();
  summary.risk_score_sum = proto.risk_score_sum();
  summary.exposure_infos.reserve(proto.exposure_infos_size());
  for (const ExposureInfoProto& info_proto : proto.exposure_infos()) {
    ENCLIENT_ASSIGN_OR_RETURN(ExposureInfo info,
                              ExposureInfoFromProto(info_proto));
    summary.exposure_infos.push_back(std::move(info));
  }
  return summary;
}

TemporaryExposureKeyProto TemporaryExposureKeyToProto(
    const TemporaryExposureKey& key) {
  TemporaryExposureKeyProto proto;
  proto.set_key_data(key.key_data);
  proto.set_rolling_start_number(key.rolling_start_number);
  proto.set_rolling_period(key.rolling_period);
  proto.set_transmission_risk_level(key.transmission_risk_level);
  return proto;
}

}  // namespace enclient
