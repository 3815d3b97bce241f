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

#include "exposure_notification_client/applications/replay/replay.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/time/time.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/core/exposure_notification_client.h"
#include "exposure_notification_client/core/exposure_status.h"
#include "exposure_notification_client/core/exposure_summary.h"
#include "exposure_notification_client/core/ingestion_orchestrator.h"
#include "exposure_notification_client/core/ingestion_service.h"
#include "exposure_notification_client/core/risk_policy.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/deps/time_proto_util.h"
#include "exposure_notification_client/port/logging.h"

namespace enclient {
namespace {

class ReplayExposureNotificationClient : public ExposureNotificationClient {
 public:
  explicit ReplayExposureNotificationClient(
      std::vector<TemporaryExposureKey> keys)
      : keys_(std::move(keys)) {}

  absl::StatusOr<std::vector<TemporaryExposureKey>> RequestTekHistory()
      override {
    return keys_;
  }

 private:
  const std::vector<TemporaryExposureKey> keys_;
};

class ReplayIngestionService : public IngestionService {
 public:
  explicit ReplayIngestionService(bool fail_upload)
      : fail_upload_(fail_upload) {}

  absl::Status UploadTeks(const DiagnosisToken& token,
                          const UploadRequestProto& request) override {
    last_request_ = request;
    if (fail_upload_) {
      return absl::UnavailableError("Ingestion service rejected the upload.");
    }
    LOG(INFO) << "Accepted upload of " << request.teks_size()
              << " keys for token " << token.token;
    accepted_ = true;
    return absl::OkStatus();
  }

  absl::Status DummyUpload() override { return absl::OkStatus(); }

  const UploadRequestProto& last_request() const { return last_request_; }
  bool accepted() const { return accepted_; }

 private:
  const bool fail_upload_;
  UploadRequestProto last_request_;
  bool accepted_ = false;
};

class CountingExposureNotifier : public ExposureNotifier {
 public:
  void NotifyExposure(const ExposureStatus& status) override {
    LOG(INFO) << "Exposure notification: " << status;
    ++count_;
  }

  int count() const { return count_; }

 private:
  int count_ = 0;
};

RawExposureSummary RawSummaryFromProto(const CheckCycleProto& cycle) {
  return {
      .days_since_last_exposure = cycle.days_since_last_exposure(),
      .matched_key_count = cycle.matched_key_count(),
      .maximum_risk_score = cycle.maximum_risk_score(),
      .high_risk_attenuation_duration_minutes =
          cycle.high_risk_attenuation_duration_minutes(),
      .medium_risk_attenuation_duration_minutes =
          cycle.medium_risk_attenuation_duration_minutes(),
      .low_risk_attenuation_duration_minutes =
          cycle.low_risk_attenuation_duration_minutes(),
      .risk_score_sum = cycle.risk_score_sum()};
}

absl::StatusOr<InfoFetcher> MakeInfoFetcher(const CheckCycleProto& cycle) {
  if (cycle.fail_info_fetch()) {
    return InfoFetcher([]() -> absl::StatusOr<std::vector<ExposureInfo>> {
      return absl::UnavailableError("Exposure infos unavailable.");
    });
  }
  std::vector<ExposureInfo> infos;
  for (const ExposureInfoProto& proto : cycle.exposure_infos()) {
    ENCLIENT_ASSIGN_OR_RETURN(ExposureInfo info, ExposureInfoFromProto(proto));
    infos.push_back(std::move(info));
  }
  return InfoFetcher(
      [infos]() -> absl::StatusOr<std::vector<ExposureInfo>> {
        return infos;
      });
}

std::vector<TemporaryExposureKey> KeysFromProto(
    const ReplayUploadProto& upload) {
  std::vector<TemporaryExposureKey> keys;
  keys.reserve(upload.teks_size());
  for (const TemporaryExposureKeyProto& proto : upload.teks()) {
    keys.push_back(
        {.key_data = proto.key_data(),
         .rolling_start_number = proto.rolling_start_number(),
         .rolling_period = proto.rolling_period(),
         .transmission_risk_level = proto.transmission_risk_level()});
  }
  return keys;
}

}  // namespace

absl::StatusOr<ReplayResultProto> RunReplay(
    const ReplayConfigProto& config,
    std::unique_ptr<ExposureStatusStore> status_store,
    std::unique_ptr<SummaryStore> summary_store) {
  std::unique_ptr<RiskPolicyProvider> risk_policy_provider;
  if (config.has_risk_policy()) {
    ENCLIENT_ASSIGN_OR_RETURN(RiskPolicy policy,
                              CreateRiskPolicy(config.risk_policy()));
    risk_policy_provider = absl::make_unique<StaticRiskPolicyProvider>(policy);
  } else {
    risk_policy_provider = absl::make_unique<StaticRiskPolicyProvider>(
        absl::UnavailableError("No risk policy configured."));
  }

  summary_store->SetCountriesOfInterest(
      std::vector<std::string>(config.countries_of_interest().begin(),
                               config.countries_of_interest().end()));
  const SummaryStore* summaries = summary_store.get();
  ReplayExposureNotificationClient client(KeysFromProto(config.upload()));
  ReplayIngestionService ingestion_service(config.upload().fail_upload());
  CountingExposureNotifier notifier;
  IngestionOrchestrator orchestrator(
      std::move(status_store), std::move(summary_store),
      risk_policy_provider.get(), &client, &ingestion_service, &notifier);

  for (int i = 0; i < config.check_cycles_size(); ++i) {
    const CheckCycleProto& cycle = config.check_cycles(i);
    ENCLIENT_ASSIGN_OR_RETURN(const absl::Time server_date,
                              DecodeTimestamp(cycle.server_date()),
                              _ << "in check cycle " << i);
    const RawExposureSummary raw = RawSummaryFromProto(cycle);
    ENCLIENT_ASSIGN_OR_RETURN(InfoFetcher info_fetcher, MakeInfoFetcher(cycle),
                              _ << "in check cycle " << i);
    ENCLIENT_RETURN_IF_ERROR(
        orchestrator.ProcessKeys(server_date, raw, std::move(info_fetcher)))
        << "in check cycle " << i;
    if (cycle.acknowledge()) {
      ENCLIENT_RETURN_IF_ERROR(orchestrator.AcknowledgeExposure());
    }
  }

  ReplayResultProto result;
  if (config.has_upload()) {
    ENCLIENT_ASSIGN_OR_RETURN(
        const absl::Time server_date,
        DecodeTimestamp(config.upload().server_date()),
        _ << "in upload");
    const DiagnosisToken token = {.kind = DiagnosisToken::Kind::kOtp,
                                  .token = config.upload().token(),
                                  .server_date = server_date};
    const absl::Status status =
        orchestrator.UploadTeks(token, config.upload().province());
    if (!status.ok()) {
      LOG(WARNING) << "Upload failed: " << status;
      result.set_upload_error(std::string(status.message()));
    }
    result.set_upload_accepted(ingestion_service.accepted());
    *result.mutable_upload_request() = ingestion_service.last_request();
  }

  ENCLIENT_ASSIGN_OR_RETURN(const ExposureStatus final_status,
                            orchestrator.exposure_status());
  ENCLIENT_RETURN_IF_ERROR(
      ExposureStatusToProto(final_status, result.mutable_final_status()));
  result.set_notification_count(notifier.count());
  ENCLIENT_ASSIGN_OR_RETURN(const std::vector<ExposureSummary> all,
                            summaries->GetSummaries());
  result.set_summary_count(all.size());
  return result;
}

}  // namespace enclient
