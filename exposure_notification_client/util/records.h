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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_UTIL_RECORDS_H_
#define EXPOSURE_NOTIFICATION_CLIENT_UTIL_RECORDS_H_

#include "absl/strings/string_view.h"
#include "riegeli/bytes/fd_reader.h"
#include "riegeli/bytes/fd_writer.h"
#include "riegeli/records/record_reader.h"
#include "riegeli/records/record_writer.h"

namespace enclient {

using RiegeliBytesSource = riegeli::FdReader<>;
using RiegeliBytesSink = riegeli::FdWriter<>;

riegeli::RecordReader<RiegeliBytesSource> MakeRecordReader(
    absl::string_view filename);
// Truncates `filename`. Records are compressed on `parallelism` background
// threads, or on the calling thread when it is 0.
riegeli::RecordWriter<RiegeliBytesSink> MakeRecordWriter(
    absl::string_view filename, int parallelism);

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_UTIL_RECORDS_H_
