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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_PARSE_TEXT_PROTO_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_PARSE_TEXT_PROTO_H_

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "exposure_notification_client/port/logging.h"
#include "google/protobuf/text_format.h"

namespace enclient {

// Parses a text format proto. Returns InvalidArgument if the text does not
// parse as a T.
template <typename T>
absl::StatusOr<T> ParseTextProto(absl::string_view asciipb) {
  T message;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(asciipb),
                                                     &message)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Failed to parse ", T::descriptor()->full_name(), " from text."));
  }
  return message;
}

// Parses a text format proto and crashes if it does not parse.
template <typename T>
T ParseTextProtoOrDie(absl::string_view asciipb) {
  absl::StatusOr<T> message = ParseTextProto<T>(asciipb);
  CHECK(message.ok()) << message.status();
  return *std::move(message);
}

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_PARSE_TEXT_PROTO_H_
