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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_FILE_UTILS_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_FILE_UTILS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace enclient {
namespace file {

// Gets the contents of a file. Returns NotFound if the file cannot be opened
// and Unavailable if it is empty.
absl::Status GetContents(absl::string_view file_name, std::string* output);

// Replaces the contents of a file. The data is written to a sibling temporary
// file which is then renamed over `file_name`, so readers observe either the
// old or the new contents.
absl::Status SetContents(absl::string_view file_name,
                         absl::string_view content);

// Atomically renames `from` over `to`.
absl::Status Rename(absl::string_view from, absl::string_view to);

// Removes a file. Removing a missing file is not an error.
absl::Status Delete(absl::string_view file_name);

}  // namespace file
}  // namespace enclient

#endif  //  EXPOSURE_NOTIFICATION_CLIENT_PORT_FILE_UTILS_H_
