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

#include "exposure_notification_client/core/ingestion_orchestrator.h"

#include <string>
#include <utility>
#include <vector>

#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/core/exposure_status_engine.h"
#include "exposure_notification_client/core/upload_preparer.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/logging.h"

namespace enclient {

IngestionOrchestrator::IngestionOrchestrator(
    std::unique_ptr<ExposureStatusStore> status_store,
    std::unique_ptr<SummaryStore> summary_store,
    const RiskPolicyProvider* risk_policy_provider,
    ExposureNotificationClient* client, IngestionService* ingestion_service,
    ExposureNotifier* notifier)
    : status_store_(std::move(status_store)),
      summary_store_(std::move(summary_store)),
      risk_policy_provider_(risk_policy_provider),
      client_(client),
      ingestion_service_(ingestion_service),
      notifier_(notifier) {
  DCHECK(status_store_ != nullptr);
  DCHECK(summary_store_ != nullptr);
  DCHECK(risk_policy_provider_ != nullptr);
}

absl::StatusOr<Evaluation> IngestionOrchestrator::CommitCheckCycle(
    absl::Time server_date, const RawExposureSummary& raw) {
  absl::MutexLock l(&status_mu_);
  const absl::StatusOr<RiskPolicy> policy =
      risk_policy_provider_->GetRiskPolicy();
  if (!policy.ok()) {
    LOG(WARNING) << "No risk policy, check cycle at " << server_date
                 << " cannot change the status: " << policy.status();
  }
  const RiskPolicy* policy_or_null = policy.ok() ? &*policy : nullptr;

  ENCLIENT_ASSIGN_OR_RETURN(const ExposureStatus current,
                            status_store_->GetExposureStatus());
  Evaluation evaluation = Evaluate(server_date, raw, current, policy_or_null);
  if (IsQualifying(evaluation.summary, policy_or_null)) {
    ENCLIENT_RETURN_IF_ERROR(
        status_store_->SetExposureStatus(evaluation.new_status));
  }
  return evaluation;
}

absl::Status IngestionOrchestrator::ProcessKeys(absl::Time server_date,
                                                const RawExposureSummary& raw,
                                                InfoFetcher info_fetcher) {
  ENCLIENT_ASSIGN_OR_RETURN(Evaluation evaluation,
                            CommitCheckCycle(server_date, raw));
  // The new status is durable; the notifier and the fetcher run unlocked.
  if (evaluation.should_fetch_details) {
    if (notifier_ != nullptr) notifier_->NotifyExposure(evaluation.new_status);
    absl::StatusOr<std::vector<ExposureInfo>> infos =
        absl::FailedPreconditionError("No info fetcher.");
    if (info_fetcher) infos = info_fetcher();
    if (infos.ok()) {
      evaluation.summary.exposure_infos = *std::move(infos);
    } else {
      LOG(ERROR) << "Failed to fetch exposure infos for check cycle at "
                 << server_date << ": " << infos.status();
    }
  }
  ENCLIENT_RETURN_IF_ERROR(summary_store_->AddSummary(evaluation.summary))
      << "while recording check cycle at " << server_date;
  return absl::OkStatus();
}

absl::Status IngestionOrchestrator::UploadTeks(const DiagnosisToken& token,
                                               absl::string_view province) {
  absl::MutexLock upload_lock(&upload_mu_);
  ENCLIENT_ASSIGN_OR_RETURN(std::vector<TemporaryExposureKey> keys,
                            client_->RequestTekHistory(),
                            _ << "while requesting TEK history");
  ENCLIENT_ASSIGN_OR_RETURN(const std::vector<ExposureSummary> summaries,
                            summary_store_->GetSummaries());
  const std::vector<std::string> countries =
      summary_store_->GetCountriesOfInterest();
  ENCLIENT_ASSIGN_OR_RETURN(
      const RiskPolicy policy, risk_policy_provider_->GetRiskPolicy(),
      _.SetErrorCode(absl::StatusCode::kFailedPrecondition).LogWarning()
          << "risk policy required to upload");

  UploadRequestProto request;
  request.set_province(std::string(province));
  for (const TemporaryExposureKey& key : keys) {
    *request.add_teks() = TemporaryExposureKeyToProto(key);
  }
  for (UploadExposureSummary& summary :
       PrepareForUpload(summaries, policy, token.server_date)) {
    *request.add_exposure_detection_summaries() = std::move(summary);
  }
  for (const std::string& country : countries) {
    request.add_countries_of_interest(country);
  }
  VLOG(1) << "Uploading " << request.teks_size() << " keys and "
          << request.exposure_detection_summaries_size() << " of "
          << summaries.size() << " summaries";
  ENCLIENT_RETURN_IF_ERROR(ingestion_service_->UploadTeks(token, request))
          .LogWarning()
      << "while uploading keys";

  absl::MutexLock l(&status_mu_);
  ENCLIENT_RETURN_IF_ERROR(status_store_->SetExposureStatus(Positive{}))
          .SetErrorCode(absl::StatusCode::kInternal)
          .LogError()
      << "upload was accepted but the Positive status was not committed";
  return absl::OkStatus();
}

absl::Status IngestionOrchestrator::DummyUpload() {
  absl::MutexLock upload_lock(&upload_mu_);
  return ingestion_service_->DummyUpload();
}

absl::Status IngestionOrchestrator::AcknowledgeExposure() {
  absl::MutexLock l(&status_mu_);
  ENCLIENT_ASSIGN_OR_RETURN(ExposureStatus status,
                            status_store_->GetExposureStatus());
  Exposed* exposed = absl::get_if<Exposed>(&status);
  if (exposed == nullptr || exposed->acknowledged) return absl::OkStatus();
  exposed->acknowledged = true;
  return status_store_->SetExposureStatus(status);
}

absl::Status IngestionOrchestrator::ResetExposureStatus() {
  absl::MutexLock l(&status_mu_);
  mock_status_.reset();
  return status_store_->SetExposureStatus(NoExposure{});
}

void IngestionOrchestrator::SetMockExposureStatus(
    absl::optional<ExposureStatus> status) {
  absl::MutexLock l(&status_mu_);
  mock_status_ = std::move(status);
}

absl::StatusOr<ExposureStatus> IngestionOrchestrator::exposure_status() const {
  absl::MutexLock l(&status_mu_);
  if (mock_status_.has_value()) return *mock_status_;
  return status_store_->GetExposureStatus();
}

absl::StatusOr<bool> IngestionOrchestrator::HasSummaries() const {
  ENCLIENT_ASSIGN_OR_RETURN(const std::vector<ExposureSummary> summaries,
                            summary_store_->GetSummaries());
  return !summaries.empty();
}

absl::Status IngestionOrchestrator::DebugCleanupDatabase() {
  ENCLIENT_RETURN_IF_ERROR(summary_store_->ResetSummaries());
  summary_store_->SetLastProcessedChunk(absl::nullopt);
  summary_store_->SetCountriesOfInterest({});
  return absl::OkStatus();
}

}  // namespace enclient
