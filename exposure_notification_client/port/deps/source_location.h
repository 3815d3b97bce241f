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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_SOURCE_LOCATION_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_SOURCE_LOCATION_H_

#include <cstdint>

namespace enclient {

// The file name and line of a call site, captured with ENCLIENT_LOC.
class SourceLocation {
 public:
  constexpr SourceLocation() : line_(0), file_name_(nullptr) {}

  // Use ENCLIENT_LOC instead of calling this directly.
  static constexpr SourceLocation DoNotInvokeDirectly(std::uint_least32_t line,
                                                      const char* file_name) {
    return SourceLocation(line, file_name);
  }

  constexpr std::uint_least32_t line() const { return line_; }
  constexpr const char* file_name() const { return file_name_; }

 private:
  constexpr SourceLocation(std::uint_least32_t line, const char* file_name)
      : line_(line), file_name_(file_name) {}

  std::uint_least32_t line_;
  const char* file_name_;
};

}  // namespace enclient

#define ENCLIENT_LOC \
  ::enclient::SourceLocation::DoNotInvokeDirectly(__LINE__, __FILE__)

#endif  // EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_SOURCE_LOCATION_H_
