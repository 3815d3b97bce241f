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

#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "exposure_notification_client/applications/replay/config.pb.h"
#include "exposure_notification_client/applications/replay/replay.h"
#include "exposure_notification_client/core/exposure_status_store.h"
#include "exposure_notification_client/core/parse_text_proto.h"
#include "exposure_notification_client/core/record_summary_store.h"
#include "exposure_notification_client/core/summary_store.h"
#include "exposure_notification_client/port/file_utils.h"
#include "exposure_notification_client/port/logging.h"
#include "google/protobuf/text_format.h"

ABSL_FLAG(std::string, replay_config_pbtxt_path, "",
          "Path to ReplayConfigProto pbtxt file.");
ABSL_FLAG(std::string, exposure_status_path, "",
          "File holding the exposure status between runs. In memory if "
          "empty.");
ABSL_FLAG(std::string, summaries_path, "",
          "Riegeli file holding the summary history between runs. In memory "
          "if empty.");
ABSL_FLAG(std::string, output_file_path, "",
          "Where the ReplayResultProto is written as text. Logged if empty.");
ABSL_FLAG(std::string, log_dir, "", "Directory of the log file, if any.");
ABSL_FLAG(int, v, 0, "Verbosity of VLOG messages.");

namespace enclient {

int Main() {
  std::string contents;
  CHECK_EQ(absl::OkStatus(),
           file::GetContents(absl::GetFlag(FLAGS_replay_config_pbtxt_path),
                             &contents));
  const ReplayConfigProto config =
      ParseTextProtoOrDie<ReplayConfigProto>(contents);

  const std::string status_path = absl::GetFlag(FLAGS_exposure_status_path);
  std::unique_ptr<ExposureStatusStore> status_store =
      status_path.empty() ? NewInMemoryExposureStatusStore()
                          : NewFileExposureStatusStore(status_path);
  const std::string summaries_path = absl::GetFlag(FLAGS_summaries_path);
  std::unique_ptr<SummaryStore> summary_store;
  if (summaries_path.empty()) {
    summary_store = NewInMemorySummaryStore();
  } else {
    absl::StatusOr<std::unique_ptr<SummaryStore>> store =
        OpenRecordSummaryStore(summaries_path);
    CHECK_OK(store) << store.status();
    summary_store = *std::move(store);
  }

  const absl::StatusOr<ReplayResultProto> result =
      RunReplay(config, std::move(status_store), std::move(summary_store));
  if (!result.ok()) {
    LOG(ERROR) << "Replay failed: " << result.status();
    return 1;
  }
  std::string text;
  CHECK(google::protobuf::TextFormat::PrintToString(*result, &text));
  const std::string output_path = absl::GetFlag(FLAGS_output_file_path);
  if (output_path.empty()) {
    LOG(INFO) << "Replay result:\n" << text;
  } else {
    CHECK_EQ(absl::OkStatus(), file::SetContents(output_path, text));
  }
  return 0;
}

}  // namespace enclient

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  enclient::SetLogDestination(absl::GetFlag(FLAGS_log_dir), "replay.log");
  enclient::SetVLogLevel(absl::GetFlag(FLAGS_v));
  return enclient::Main();
}
