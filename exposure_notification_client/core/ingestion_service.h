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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_INGESTION_SERVICE_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_INGESTION_SERVICE_H_

#include "absl/status/status.h"
#include "exposure_notification_client/core/exposure_notification.pb.h"
#include "exposure_notification_client/core/exposure_summary.h"

namespace enclient {

// Transport to the key ingestion server.
class IngestionService {
 public:
  // Submits the keys and exposure history authorized by `token`.
  virtual absl::Status UploadTeks(const DiagnosisToken& token,
                                  const UploadRequestProto& request) = 0;
  // Sends cover traffic indistinguishable from an upload on the wire.
  virtual absl::Status DummyUpload() = 0;
  virtual ~IngestionService() = default;
};

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_INGESTION_SERVICE_H_
