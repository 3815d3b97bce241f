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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_INGESTION_ORCHESTRATOR_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_INGESTION_ORCHESTRATOR_H_

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "exposure_notification_client/core/exposure_notification_client.h"
#include "exposure_notification_client/core/exposure_status.h"
#include "exposure_notification_client/core/exposure_status_engine.h"
#include "exposure_notification_client/core/exposure_status_store.h"
#include "exposure_notification_client/core/exposure_summary.h"
#include "exposure_notification_client/core/ingestion_service.h"
#include "exposure_notification_client/core/risk_policy.h"
#include "exposure_notification_client/core/summary_store.h"

namespace enclient {

// Drives check cycles and uploads against the stores. The status updates of
// check cycles, acknowledge, reset and uploads are serialized on one lock so
// none is lost. Uploads are serialized on a second lock. Neither lock is held
// while the notifier or an info fetcher runs.
class IngestionOrchestrator {
 public:
  // The orchestrator owns the stores. The remaining collaborators must
  // outlive it.
  IngestionOrchestrator(std::unique_ptr<ExposureStatusStore> status_store,
                        std::unique_ptr<SummaryStore> summary_store,
                        const RiskPolicyProvider* risk_policy_provider,
                        ExposureNotificationClient* client,
                        IngestionService* ingestion_service,
                        ExposureNotifier* notifier);

  IngestionOrchestrator(const IngestionOrchestrator&) = delete;
  IngestionOrchestrator& operator=(const IngestionOrchestrator&) = delete;

  // Runs one check cycle for the summary the matching engine reported at
  // `server_date`. `info_fetcher` is only called if the user is notified,
  // after the new status is committed. Returns an error only if a store
  // fails.
  absl::Status ProcessKeys(absl::Time server_date,
                           const RawExposureSummary& raw,
                           InfoFetcher info_fetcher)
      ABSL_LOCKS_EXCLUDED(status_mu_);

  // Uploads the device's keys with its exposure history. On success the
  // status becomes Positive; on failure nothing changes. kInternal means the
  // service accepted the upload but Positive could not be stored.
  absl::Status UploadTeks(const DiagnosisToken& token,
                          absl::string_view province)
      ABSL_LOCKS_EXCLUDED(upload_mu_, status_mu_);

  absl::Status DummyUpload();

  absl::Status AcknowledgeExposure();
  absl::Status ResetExposureStatus();

  // Overrides the status reported by exposure_status() until reset. Check
  // cycles keep using the stored status.
  void SetMockExposureStatus(absl::optional<ExposureStatus> status);

  absl::StatusOr<ExposureStatus> exposure_status() const;
  absl::StatusOr<bool> HasSummaries() const;

  // Clears the summary history and the key download bookkeeping.
  absl::Status DebugCleanupDatabase();

 private:
  // Evaluates the cycle and commits a qualifying status.
  absl::StatusOr<Evaluation> CommitCheckCycle(absl::Time server_date,
                                              const RawExposureSummary& raw)
      ABSL_LOCKS_EXCLUDED(status_mu_);

  const std::unique_ptr<ExposureStatusStore> status_store_;
  const std::unique_ptr<SummaryStore> summary_store_;
  const RiskPolicyProvider* const risk_policy_provider_;
  ExposureNotificationClient* const client_;
  IngestionService* const ingestion_service_;
  ExposureNotifier* const notifier_;

  mutable absl::Mutex status_mu_;
  absl::optional<ExposureStatus> mock_status_ ABSL_GUARDED_BY(status_mu_);
  absl::Mutex upload_mu_ ABSL_ACQUIRED_BEFORE(status_mu_);
};

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_INGESTION_ORCHESTRATOR_H_
