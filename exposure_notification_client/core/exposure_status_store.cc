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

#include "exposure_notification_client/core/exposure_status_store.h"

#include <string>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "exposure_notification_client/port/deps/status_macros.h"
#include "exposure_notification_client/port/file_utils.h"
#include "exposure_notification_client/port/logging.h"

namespace enclient {
namespace {

class InMemoryExposureStatusStore : public ExposureStatusStore {
 public:
  absl::StatusOr<ExposureStatus> GetExposureStatus() const override {
    absl::MutexLock l(&mu_);
    return status_;
  }

  absl::Status SetExposureStatus(const ExposureStatus& status) override {
    absl::MutexLock l(&mu_);
    status_ = status;
    return absl::OkStatus();
  }

 private:
  mutable absl::Mutex mu_;
  ExposureStatus status_ ABSL_GUARDED_BY(mu_) = NoExposure{};
};

class FileExposureStatusStore : public ExposureStatusStore {
 public:
  explicit FileExposureStatusStore(absl::string_view path) : path_(path) {}

  absl::StatusOr<ExposureStatus> GetExposureStatus() const override {
    absl::MutexLock l(&mu_);
    std::string contents;
    const absl::Status status = file::GetContents(path_, &contents);
    if (status.code() == absl::StatusCode::kNotFound) {
      return ExposureStatus(NoExposure{});
    }
    ENCLIENT_RETURN_IF_ERROR(status) << "while reading exposure status";
    ExposureStatusProto proto;
    if (!proto.ParseFromString(contents)) {
      return absl::DataLossError(
          absl::StrCat("Corrupt exposure status in ", path_));
    }
    return ExposureStatusFromProto(proto);
  }

  absl::Status SetExposureStatus(const ExposureStatus& status) override {
    ExposureStatusProto proto;
    ENCLIENT_RETURN_IF_ERROR(ExposureStatusToProto(status, &proto))
        << "while encoding " << status;
    absl::MutexLock l(&mu_);
    ENCLIENT_RETURN_IF_ERROR(
        file::SetContents(path_, proto.SerializeAsString()))
            .LogError()
        << "while committing " << status;
    VLOG(1) << "Committed exposure status " << status << " to " << path_;
    return absl::OkStatus();
  }

 private:
  const std::string path_;
  mutable absl::Mutex mu_;
};

}  // namespace

std::unique_ptr<ExposureStatusStore> NewInMemoryExposureStatusStore() {
  return absl::make_unique<InMemoryExposureStatusStore>();
}

std::unique_ptr<ExposureStatusStore> NewFileExposureStatusStore(
    absl::string_view path) {
  return absl::make_unique<FileExposureStatusStore>(path);
}

}  // namespace enclient
