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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_UTIL_TEST_UTIL_H_
#define EXPOSURE_NOTIFICATION_CLIENT_UTIL_TEST_UTIL_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/core/exposure_notification_client.h"
#include "exposure_notification_client/core/exposure_status.h"
#include "exposure_notification_client/core/exposure_status_store.h"
#include "exposure_notification_client/core/exposure_summary.h"
#include "exposure_notification_client/core/integral_types.h"
#include "exposure_notification_client/core/ingestion_service.h"
#include "exposure_notification_client/core/risk_policy.h"
#include "exposure_notification_client/core/summary_store.h"
#include "gmock/gmock.h"

namespace enclient {

class MockExposureNotificationClient : public ExposureNotificationClient {
 public:
  MOCK_METHOD(absl::StatusOr<std::vector<TemporaryExposureKey>>,
              RequestTekHistory, (), (override));
};

class MockIngestionService : public IngestionService {
 public:
  MOCK_METHOD(absl::Status, UploadTeks,
              (const DiagnosisToken& token, const UploadRequestProto& request),
              (override));
  MOCK_METHOD(absl::Status, DummyUpload, (), (override));
};

class MockExposureNotifier : public ExposureNotifier {
 public:
  MOCK_METHOD(void, NotifyExposure, (const ExposureStatus& status),
              (override));
};

class MockRiskPolicyProvider : public RiskPolicyProvider {
 public:
  MOCK_METHOD(absl::StatusOr<RiskPolicy>, GetRiskPolicy, (),
              (const, override));
};

class MockExposureStatusStore : public ExposureStatusStore {
 public:
  MOCK_METHOD(absl::StatusOr<ExposureStatus>, GetExposureStatus, (),
              (const, override));
  MOCK_METHOD(absl::Status, SetExposureStatus, (const ExposureStatus& status),
              (override));
};

class MockSummaryStore : public SummaryStore {
 public:
  MOCK_METHOD(absl::Status, AddSummary, (const ExposureSummary& summary),
              (override));
  MOCK_METHOD(absl::StatusOr<std::vector<ExposureSummary>>, GetSummaries, (),
              (const, override));
  MOCK_METHOD(absl::Status, ResetSummaries, (), (override));
  MOCK_METHOD(std::vector<std::string>, GetCountriesOfInterest, (),
              (const, override));
  MOCK_METHOD(void, SetCountriesOfInterest,
              (std::vector<std::string> countries), (override));
  MOCK_METHOD(absl::optional<int64>, GetLastProcessedChunk, (),
              (const, override));
  MOCK_METHOD(void, SetLastProcessedChunk, (absl::optional<int64> chunk),
              (override));
};

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_UTIL_TEST_UTIL_H_
