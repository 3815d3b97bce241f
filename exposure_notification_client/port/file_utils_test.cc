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

#include <string>

#include "absl/strings/str_cat.h"
#include "exposure_notification_client/port/deps/status_matchers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace enclient {
namespace {

TEST(FileUtilsTest, SetContentsThenGetContents) {
  const std::string path = absl::StrCat(testing::TempDir(), "/set_get");
  ENCLIENT_ASSERT_OK(file::SetContents(path, "minimum_risk_score: 5"));
  std::string contents;
  ENCLIENT_ASSERT_OK(file::GetContents(path, &contents));
  EXPECT_EQ(contents, "minimum_risk_score: 5");

  ENCLIENT_ASSERT_OK(file::SetContents(path, "replaced"));
  ENCLIENT_ASSERT_OK(file::GetContents(path, &contents));
  EXPECT_EQ(contents, "replaced");
  ENCLIENT_EXPECT_OK(file::Delete(path));
}

TEST(FileUtilsTest, MissingFileIsNotFound) {
  const std::string path = absl::StrCat(testing::TempDir(), "/missing");
  ENCLIENT_ASSERT_OK(file::Delete(path));
  std::string contents;
  EXPECT_THAT(file::GetContents(path, &contents),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(FileUtilsTest, EmptyFileIsUnavailable) {
  const std::string path = absl::StrCat(testing::TempDir(), "/empty");
  ENCLIENT_ASSERT_OK(file::SetContents(path, ""));
  std::string contents;
  EXPECT_THAT(file::GetContents(path, &contents),
              StatusIs(absl::StatusCode::kUnavailable, "File empty."));
  ENCLIENT_EXPECT_OK(file::Delete(path));
}

TEST(FileUtilsTest, UnwritableDirectoryFails) {
  EXPECT_THAT(file::SetContents("/nonexistent_dir/status", "x"),
              StatusIs(absl::StatusCode::kUnavailable));
}

}  // namespace
}  // namespace enclient
