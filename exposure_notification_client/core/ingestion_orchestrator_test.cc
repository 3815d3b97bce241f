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

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "exposure_notification_client/port/deps/status_matchers.h"
#include "exposure_notification_client/port/file_utils.h"
#include "exposure_notification_client/util/test_util.h"
#include "exposure_notification_client/util/time_utils.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace enclient {
namespace {

using testing::_;
using testing::AllOf;
using testing::DoAll;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::NiceMock;
using testing::Return;
using testing::SaveArg;
using testing::SizeIs;
using testing::StrictMock;

absl::Time Day(int n) { return absl::UnixEpoch() + kDay * n; }

const RiskPolicy kPolicy = {
    .minimum_risk_score = 5, .max_summary_count = 2, .max_info_count = 1};

RawExposureSummary Raw(int days_since_last_exposure, int matched_key_count,
                       int maximum_risk_score) {
  return {.days_since_last_exposure = days_since_last_exposure,
          .matched_key_count = matched_key_count,
          .maximum_risk_score = maximum_risk_score,
          .risk_score_sum = maximum_risk_score};
}

std::vector<ExposureInfo> Infos(absl::Time date) {
  return {{.date = date,
           .duration_minutes = 10,
           .attenuation_value = 40,
           .attenuation_durations_minutes = {5, 5, 0},
           .transmission_risk_level = 3,
           .total_risk_score = 10}};
}

InfoFetcher FetchReturning(absl::StatusOr<std::vector<ExposureInfo>> infos) {
  return [infos]() { return infos; };
}

InfoFetcher FetchNever() {
  return []() -> absl::StatusOr<std::vector<ExposureInfo>> {
    ADD_FAILURE() << "Infos fetched without a notification.";
    return std::vector<ExposureInfo>();
  };
}

const DiagnosisToken kToken = {.kind = DiagnosisToken::Kind::kOtp,
                               .token = "123456",
                               .server_date = Day(20)};

class IngestionOrchestratorTest : public testing::Test {
 protected:
  IngestionOrchestratorTest() {
    auto status_store = NewInMemoryExposureStatusStore();
    auto summary_store = NewInMemorySummaryStore();
    status_store_ = status_store.get();
    summary_store_ = summary_store.get();
    ON_CALL(policy_provider_, GetRiskPolicy()).WillByDefault(Return(kPolicy));
    orchestrator_ = absl::make_unique<IngestionOrchestrator>(
        std::move(status_store), std::move(summary_store), &policy_provider_,
        &client_, &ingestion_service_, &notifier_);
  }

  std::vector<ExposureSummary> Summaries() {
    absl::StatusOr<std::vector<ExposureSummary>> summaries =
        summary_store_->GetSummaries();
    EXPECT_TRUE(summaries.ok()) << summaries.status();
    return summaries.ok() ? *std::move(summaries)
                          : std::vector<ExposureSummary>();
  }

  NiceMock<MockRiskPolicyProvider> policy_provider_;
  StrictMock<MockExposureNotificationClient> client_;
  StrictMock<MockIngestionService> ingestion_service_;
  StrictMock<MockExposureNotifier> notifier_;
  ExposureStatusStore* status_store_;
  SummaryStore* summary_store_;
  std::unique_ptr<IngestionOrchestrator> orchestrator_;
};

TEST_F(IngestionOrchestratorTest, FirstExposureCommitsNotifiesThenFetches) {
  const ExposureStatus exposed = Exposed{.last_exposure_date = Day(8)};
  bool notified = false;
  EXPECT_CALL(notifier_, NotifyExposure(exposed))
      .WillOnce([&](const ExposureStatus& status) {
        EXPECT_THAT(status_store_->GetExposureStatus(), IsOkAndHolds(exposed));
        notified = true;
      });
  InfoFetcher fetcher = [&]() -> absl::StatusOr<std::vector<ExposureInfo>> {
    EXPECT_TRUE(notified);
    return Infos(Day(8));
  };

  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(2, 1, 10), fetcher));

  EXPECT_THAT(orchestrator_->exposure_status(), IsOkAndHolds(exposed));
  const std::vector<ExposureSummary> summaries = Summaries();
  ASSERT_THAT(summaries, SizeIs(1));
  EXPECT_EQ(summaries[0].last_exposure_date, Day(8));
  EXPECT_EQ(summaries[0].exposure_infos, Infos(Day(8)));
}

TEST_F(IngestionOrchestratorTest, FetchFailureStoresSummaryWithoutInfos) {
  EXPECT_CALL(notifier_, NotifyExposure(_));
  ENCLIENT_ASSERT_OK(orchestrator_->ProcessKeys(
      Day(10), Raw(2, 1, 10),
      FetchReturning(absl::UnavailableError("platform busy"))));

  EXPECT_THAT(
      orchestrator_->exposure_status(),
      IsOkAndHolds(ExposureStatus(Exposed{.last_exposure_date = Day(8)})));
  const std::vector<ExposureSummary> summaries = Summaries();
  ASSERT_THAT(summaries, SizeIs(1));
  EXPECT_THAT(summaries[0].exposure_infos, IsEmpty());
}

TEST_F(IngestionOrchestratorTest, LaterExposureNotifiesAgain) {
  EXPECT_CALL(notifier_, NotifyExposure(_)).Times(2);
  ENCLIENT_ASSERT_OK(orchestrator_->ProcessKeys(
      Day(10), Raw(2, 1, 10), FetchReturning(Infos(Day(8)))));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(11), Raw(2, 1, 10), FetchNever()));
  ENCLIENT_ASSERT_OK(orchestrator_->ProcessKeys(
      Day(12), Raw(1, 2, 10), FetchReturning(Infos(Day(11)))));

  EXPECT_THAT(
      orchestrator_->exposure_status(),
      IsOkAndHolds(ExposureStatus(Exposed{.last_exposure_date = Day(11)})));
  const std::vector<ExposureSummary> summaries = Summaries();
  ASSERT_THAT(summaries, SizeIs(3));
  EXPECT_THAT(summaries[1].exposure_infos, IsEmpty());
  EXPECT_EQ(summaries[2].exposure_infos, Infos(Day(11)));
}

TEST_F(IngestionOrchestratorTest, NonQualifyingCycleIsOnlyRecorded) {
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(2, 1, 4), FetchNever()));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(11), Raw(0, 0, 0), FetchNever()));

  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
  EXPECT_THAT(Summaries(), SizeIs(2));
}

TEST_F(IngestionOrchestratorTest, UnavailablePolicyFailsClosed) {
  EXPECT_CALL(policy_provider_, GetRiskPolicy())
      .WillOnce(Return(absl::UnavailableError("no settings")));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(2, 5, 100), FetchNever()));

  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
  EXPECT_THAT(Summaries(), SizeIs(1));
}

TEST_F(IngestionOrchestratorTest, DegenerateSummaryIsRecordedButIgnored) {
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(-1, 1, 10), FetchNever()));
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
  EXPECT_THAT(Summaries(), SizeIs(1));
}

TEST_F(IngestionOrchestratorTest, UnencodableDateIsRecordedButIgnored) {
  const std::string path =
      absl::StrCat(testing::TempDir(), "/orchestrator_exposure_status");
  ENCLIENT_ASSERT_OK(file::Delete(path));
  auto summary_store = NewInMemorySummaryStore();
  SummaryStore* summaries = summary_store.get();
  IngestionOrchestrator orchestrator(NewFileExposureStatusStore(path),
                                     std::move(summary_store),
                                     &policy_provider_, &client_,
                                     &ingestion_service_, &notifier_);

  // The last exposure would fall a million days before the check.
  ENCLIENT_ASSERT_OK(
      orchestrator.ProcessKeys(Day(18000), Raw(1000000, 1, 10), FetchNever()));

  EXPECT_THAT(orchestrator.exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
  EXPECT_THAT(summaries->GetSummaries(), IsOkAndHolds(SizeIs(1)));
  ENCLIENT_EXPECT_OK(file::Delete(path));
}

TEST_F(IngestionOrchestratorTest, NotifierAndFetcherMayUseTheOrchestrator) {
  const ExposureStatus exposed = Exposed{.last_exposure_date = Day(8)};
  EXPECT_CALL(notifier_, NotifyExposure(exposed))
      .WillOnce([&](const ExposureStatus&) {
        EXPECT_THAT(orchestrator_->exposure_status(), IsOkAndHolds(exposed));
      });
  InfoFetcher fetcher = [&]() -> absl::StatusOr<std::vector<ExposureInfo>> {
    ENCLIENT_EXPECT_OK(orchestrator_->AcknowledgeExposure());
    return Infos(Day(8));
  };

  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(2, 1, 10), fetcher));

  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(
                  Exposed{.last_exposure_date = Day(8), .acknowledged = true})));
  EXPECT_THAT(Summaries(), SizeIs(1));
}

TEST_F(IngestionOrchestratorTest, PositiveAbsorbsCheckCycles) {
  ENCLIENT_ASSERT_OK(status_store_->SetExposureStatus(Positive{}));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(0, 3, 50), FetchNever()));
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(Positive{})));
  EXPECT_THAT(Summaries(), SizeIs(1));
}

TEST_F(IngestionOrchestratorTest, StatusStoreFailureIsReturned) {
  auto status_store = absl::make_unique<NiceMock<MockExposureStatusStore>>();
  auto summary_store = absl::make_unique<StrictMock<MockSummaryStore>>();
  ON_CALL(*status_store, GetExposureStatus())
      .WillByDefault(Return(ExposureStatus(NoExposure{})));
  EXPECT_CALL(*status_store, SetExposureStatus(_))
      .WillOnce(Return(absl::UnavailableError("disk full")));
  IngestionOrchestrator orchestrator(std::move(status_store),
                                     std::move(summary_store),
                                     &policy_provider_, &client_,
                                     &ingestion_service_, &notifier_);

  EXPECT_THAT(orchestrator.ProcessKeys(Day(10), Raw(2, 1, 10), FetchNever()),
              StatusIs(absl::StatusCode::kUnavailable));
}

TEST_F(IngestionOrchestratorTest, UploadSendsCappedHistoryAndSetsPositive) {
  const TemporaryExposureKey key = {.key_data = "0123456789abcdef",
                                    .rolling_start_number = 2650000,
                                    .rolling_period = 144,
                                    .transmission_risk_level = 4};
  EXPECT_CALL(notifier_, NotifyExposure(_));
  ENCLIENT_ASSERT_OK(orchestrator_->ProcessKeys(
      Day(10), Raw(2, 1, 10), FetchReturning(Infos(Day(8)))));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(11), Raw(3, 1, 10), FetchNever()));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(12), Raw(0, 0, 0), FetchNever()));
  summary_store_->SetCountriesOfInterest({"DE", "FR"});

  EXPECT_CALL(client_, RequestTekHistory())
      .WillOnce(Return(std::vector<TemporaryExposureKey>{key}));
  UploadRequestProto request;
  EXPECT_CALL(ingestion_service_, UploadTeks(_, _))
      .WillOnce(DoAll(SaveArg<1>(&request), Return(absl::OkStatus())));

  ENCLIENT_ASSERT_OK(orchestrator_->UploadTeks(kToken, "BE"));

  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(Positive{})));
  EXPECT_EQ(request.province(), "BE");
  ASSERT_EQ(request.teks_size(), 1);
  EXPECT_EQ(request.teks(0).key_data(), key.key_data);
  EXPECT_EQ(request.teks(0).rolling_start_number(), 2650000);
  EXPECT_THAT(request.countries_of_interest(), ElementsAre("DE", "FR"));
  // The two most recent summaries, newest first; the info of day 10 was
  // dropped with its summary.
  ASSERT_EQ(request.exposure_detection_summaries_size(), 2);
  EXPECT_EQ(request.exposure_detection_summaries(0).date(),
            FormatIsoDate(Day(12)));
  EXPECT_EQ(request.exposure_detection_summaries(1).date(),
            FormatIsoDate(Day(11)));
  EXPECT_EQ(request.exposure_detection_summaries(1).days_since_last_exposure(),
            12);
  EXPECT_EQ(request.exposure_detection_summaries(0).exposure_info_size() +
                request.exposure_detection_summaries(1).exposure_info_size(),
            0);
  // History is kept after upload.
  EXPECT_THAT(orchestrator_->HasSummaries(), IsOkAndHolds(true));
}

TEST_F(IngestionOrchestratorTest, UploadFailureChangesNothing) {
  ENCLIENT_ASSERT_OK(status_store_->SetExposureStatus(
      Exposed{.last_exposure_date = Day(8), .acknowledged = true}));
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(2, 1, 10), FetchNever()));
  EXPECT_CALL(client_, RequestTekHistory())
      .WillOnce(Return(std::vector<TemporaryExposureKey>()));
  EXPECT_CALL(ingestion_service_, UploadTeks(_, _))
      .WillOnce(Return(absl::UnavailableError("server down")));

  EXPECT_THAT(orchestrator_->UploadTeks(kToken, "BE"),
              StatusIs(absl::StatusCode::kUnavailable));
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(
                  Exposed{.last_exposure_date = Day(8), .acknowledged = true})));
  EXPECT_THAT(Summaries(), SizeIs(1));
}

TEST_F(IngestionOrchestratorTest, AcceptedUploadWithoutPositiveIsInternal) {
  auto status_store = absl::make_unique<NiceMock<MockExposureStatusStore>>();
  ON_CALL(*status_store, GetExposureStatus())
      .WillByDefault(Return(ExposureStatus(NoExposure{})));
  EXPECT_CALL(*status_store, SetExposureStatus(ExposureStatus(Positive{})))
      .WillOnce(Return(absl::UnavailableError("disk full")));
  IngestionOrchestrator orchestrator(std::move(status_store),
                                     NewInMemorySummaryStore(),
                                     &policy_provider_, &client_,
                                     &ingestion_service_, &notifier_);
  EXPECT_CALL(client_, RequestTekHistory())
      .WillOnce(Return(std::vector<TemporaryExposureKey>()));
  EXPECT_CALL(ingestion_service_, UploadTeks(_, _))
      .WillOnce(Return(absl::OkStatus()));

  EXPECT_THAT(orchestrator.UploadTeks(kToken, "BE"),
              StatusIs(absl::StatusCode::kInternal,
                       AllOf(HasSubstr("disk full"), HasSubstr("accepted"))));
}

TEST_F(IngestionOrchestratorTest, UploadWithoutPolicyIsFailedPrecondition) {
  EXPECT_CALL(client_, RequestTekHistory())
      .WillOnce(Return(std::vector<TemporaryExposureKey>()));
  EXPECT_CALL(policy_provider_, GetRiskPolicy())
      .WillOnce(Return(absl::UnavailableError("no settings")));

  EXPECT_THAT(orchestrator_->UploadTeks(kToken, "BE"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
}

TEST_F(IngestionOrchestratorTest, TekHistoryFailureAbortsUpload) {
  EXPECT_CALL(client_, RequestTekHistory())
      .WillOnce(Return(absl::PermissionDeniedError("user declined")));

  EXPECT_THAT(orchestrator_->UploadTeks(kToken, "BE"),
              StatusIs(absl::StatusCode::kPermissionDenied));
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
}

TEST_F(IngestionOrchestratorTest, DummyUploadOnlyReachesTheService) {
  EXPECT_CALL(ingestion_service_, DummyUpload())
      .WillOnce(Return(absl::OkStatus()));
  ENCLIENT_EXPECT_OK(orchestrator_->DummyUpload());
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
}

TEST_F(IngestionOrchestratorTest, AcknowledgeMarksExposedOnly) {
  ENCLIENT_ASSERT_OK(orchestrator_->AcknowledgeExposure());
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));

  EXPECT_CALL(notifier_, NotifyExposure(_));
  ENCLIENT_ASSERT_OK(orchestrator_->ProcessKeys(
      Day(10), Raw(2, 1, 10), FetchReturning(Infos(Day(8)))));
  ENCLIENT_ASSERT_OK(orchestrator_->AcknowledgeExposure());
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(
                  Exposed{.last_exposure_date = Day(8), .acknowledged = true})));

  ENCLIENT_ASSERT_OK(status_store_->SetExposureStatus(Positive{}));
  ENCLIENT_ASSERT_OK(orchestrator_->AcknowledgeExposure());
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(Positive{})));
}

TEST_F(IngestionOrchestratorTest, MockStatusOnlyAffectsReportedStatus) {
  orchestrator_->SetMockExposureStatus(ExposureStatus(Positive{}));
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(Positive{})));

  // The engine still starts from the stored NoExposure.
  EXPECT_CALL(notifier_, NotifyExposure(_));
  ENCLIENT_ASSERT_OK(orchestrator_->ProcessKeys(
      Day(10), Raw(2, 1, 10), FetchReturning(Infos(Day(8)))));
  EXPECT_THAT(
      status_store_->GetExposureStatus(),
      IsOkAndHolds(ExposureStatus(Exposed{.last_exposure_date = Day(8)})));

  orchestrator_->SetMockExposureStatus(absl::nullopt);
  EXPECT_THAT(
      orchestrator_->exposure_status(),
      IsOkAndHolds(ExposureStatus(Exposed{.last_exposure_date = Day(8)})));
}

TEST_F(IngestionOrchestratorTest, ResetClearsStatusAndMock) {
  ENCLIENT_ASSERT_OK(status_store_->SetExposureStatus(Positive{}));
  orchestrator_->SetMockExposureStatus(
      ExposureStatus(Exposed{.last_exposure_date = Day(3)}));

  ENCLIENT_ASSERT_OK(orchestrator_->ResetExposureStatus());
  EXPECT_THAT(orchestrator_->exposure_status(),
              IsOkAndHolds(ExposureStatus(NoExposure{})));
}

TEST_F(IngestionOrchestratorTest, DebugCleanupClearsHistoryAndBookkeeping) {
  ENCLIENT_ASSERT_OK(
      orchestrator_->ProcessKeys(Day(10), Raw(0, 0, 0), FetchNever()));
  summary_store_->SetCountriesOfInterest({"NL"});
  summary_store_->SetLastProcessedChunk(42);
  EXPECT_THAT(orchestrator_->HasSummaries(), IsOkAndHolds(true));

  ENCLIENT_ASSERT_OK(orchestrator_->DebugCleanupDatabase());
  EXPECT_THAT(orchestrator_->HasSummaries(), IsOkAndHolds(false));
  EXPECT_THAT(summary_store_->GetCountriesOfInterest(), IsEmpty());
  EXPECT_EQ(summary_store_->GetLastProcessedChunk(), absl::nullopt);
}

}  // namespace
}  // namespace enclient
