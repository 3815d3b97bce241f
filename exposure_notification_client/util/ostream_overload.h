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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_UTIL_OSTREAM_OVERLOAD_H_
#define EXPOSURE_NOTIFICATION_CLIENT_UTIL_OSTREAM_OVERLOAD_H_

#include <ostream>
#include <vector>

// Expands to an operator<< for std::vector<T> in the namespace where it is
// used. Elements are printed with their own operator<<, as "[a, b, c]".
#define ENCLIENT_OVERLOAD_VECTOR_OSTREAM_OPS                         \
  template <typename T>                                              \
  std::ostream& operator<<(std::ostream& strm,                       \
                           const std::vector<T>& values) {           \
    strm << '[';                                                     \
    const char* separator = "";                                      \
    for (const T& value : values) {                                  \
      strm << separator << value;                                    \
      separator = ", ";                                              \
    }                                                                \
    return strm << ']';                                              \
  }

#endif  // EXPOSURE_NOTIFICATION_CLIENT_UTIL_OSTREAM_OVERLOAD_H_
