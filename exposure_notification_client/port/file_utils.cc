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

#include "exposure_notification_client/port/file_utils.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "exposure_notification_client/port/logging.h"

namespace enclient {
namespace file {

absl::Status GetContents(absl::string_view file_name, std::string* output) {
  std::ifstream input_file((std::string(file_name)), std::ios::binary);
  if (input_file.good()) {
    std::stringstream buffer;
    buffer << input_file.rdbuf();
    *output = buffer.str();
    return output->empty()
               ? absl::Status(absl::StatusCode::kUnavailable, "File empty.")
               : absl::OkStatus();
  } else {
    return absl::Status(absl::StatusCode::kNotFound,
                        absl::StrCat("File not found: ", file_name));
  }
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view content) {
  const std::string path(file_name);
  const std::string temp_path = absl::StrCat(path, ".tmp");
  {
    std::ofstream ofstream(temp_path, std::ios::binary | std::ios::trunc);
    if (!ofstream.is_open()) {
      return absl::Status(absl::StatusCode::kUnavailable,
                          absl::StrCat("Failed to open: ", temp_path));
    }
    ofstream.write(content.data(), content.size());
    ofstream.close();
    if (ofstream.fail()) {
      return absl::Status(absl::StatusCode::kUnavailable,
                          absl::StrCat("Failed to write: ", temp_path));
    }
  }
  return Rename(temp_path, path);
}

absl::Status Rename(absl::string_view from, absl::string_view to) {
  std::error_code error;
  std::filesystem::rename(std::string(from), std::string(to), error);
  if (error) {
    LOG(ERROR) << "Rename of " << from << " failed: " << error.message();
    return absl::Status(
        absl::StatusCode::kUnavailable,
        absl::StrCat("Failed to rename ", from, ": ", error.message()));
  }
  return absl::OkStatus();
}

absl::Status Delete(absl::string_view file_name) {
  std::error_code error;
  std::filesystem::remove(std::string(file_name), error);
  if (error) {
    return absl::Status(
        absl::StatusCode::kUnavailable,
        absl::StrCat("Failed to delete ", file_name, ": ", error.message()));
  }
  return absl::OkStatus();
}

}  // namespace file
}  // namespace enclient
