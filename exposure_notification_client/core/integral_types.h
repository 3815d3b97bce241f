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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_CORE_INTEGRAL_TYPES_H_
#define EXPOSURE_NOTIFICATION_CLIENT_CORE_INTEGRAL_TYPES_H_

#include <cstdint>

namespace enclient {

typedef int32_t int32;
typedef int64_t int64;
typedef uint8_t uint8;
typedef uint32_t uint32;

}  // namespace enclient

#endif  // EXPOSURE_NOTIFICATION_CLIENT_CORE_INTEGRAL_TYPES_H_
