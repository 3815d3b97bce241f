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

#include "exposure_notification_client/core/exposure_status.h"

#include "absl/strings/str_cat.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/deps/time_proto_util.h"

namespace enclient {
namespace {

struct ProtoEncoder {
  absl::Status operator()(const NoExposure&) const {
    proto->set_kind(ExposureStatusProto::NONE);
    return absl::OkStatus();
  }
  absl::Status operator()(const Exposed& exposed) const {
    proto->set_kind(ExposureStatusProto::EXPOSED);
    proto->set_acknowledged(exposed.acknowledged);
    return EncodeTimestamp(exposed.last_exposure_date,
                                proto->mutable_last_exposure_date());
  }
  absl::Status operator()(const Positive&) const {
    proto->set_kind(ExposureStatusProto::POSITIVE);
    return absl::OkStatus();
  }

  ExposureStatusProto* proto;
};

}  // namespace

std::ostream& operator<<(std::ostream& strm, const ExposureStatus& status) {
  absl::visit([&strm](const auto& alternative) { strm << alternative; },
              status);
  return strm;
}

absl::Status ExposureStatusToProto(const ExposureStatus& status,
                                   ExposureStatusProto* proto) {
  proto->Clear();
  return absl::visit(ProtoEncoder{proto}, status);
}

absl::StatusOr<ExposureStatus> ExposureStatusFromProto(
    const ExposureStatusProto& proto) {
  switch (proto.kind()) {
    case ExposureStatusProto::NONE:
      return ExposureStatus(NoExposure{});
    case ExposureStatusProto::EXPOSED: {
      Exposed exposed;
      ENCLIENT_ASSIGN_OR_RETURN(
          exposed.last_exposure_date,
          DecodeTimestamp(proto.last_exposure_date()),
          _.SetErrorCode(absl::StatusCode::kInvalidArgument)
              << "while decoding last exposure date");
      exposed.acknowledged = proto.acknowledged();
      return ExposureStatus(exposed);
    }
    case ExposureStatusProto::POSITIVE:
      return ExposureStatus(Positive{});
    default:
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown exposure status kind: ", proto.kind()));
  }
}

}  // namespace enclient
