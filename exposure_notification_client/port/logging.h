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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_LOGGING_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_LOGGING_H_

#include "absl/base/log_severity.h"
#include "absl/base/optimization.h"
#include "exposure_notification_client/port/deps/logging.h"

#define ENCLIENT_LOGGING_INTERNAL_LOG_INFO                \
  ::enclient::logging_internal::LogMessage(__FILE__, __LINE__, \
                                           ::absl::LogSeverity::kInfo)
#define ENCLIENT_LOGGING_INTERNAL_LOG_WARNING             \
  ::enclient::logging_internal::LogMessage(__FILE__, __LINE__, \
                                           ::absl::LogSeverity::kWarning)
#define ENCLIENT_LOGGING_INTERNAL_LOG_ERROR               \
  ::enclient::logging_internal::LogMessage(__FILE__, __LINE__, \
                                           ::absl::LogSeverity::kError)
#define ENCLIENT_LOGGING_INTERNAL_LOG_FATAL \
  ::enclient::logging_internal::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) ENCLIENT_LOGGING_INTERNAL_LOG_##severity.stream()

#define LOG_IF(severity, condition) \
  !(condition) ? (void)0            \
               : ::enclient::logging_internal::LogMessageVoidify() & LOG(severity)

#define VLOG_IS_ON(level) ((level) <= ::enclient::GetVLogLevel())

#define VLOG(level) LOG_IF(INFO, VLOG_IS_ON(level))

#define CHECK(condition)                                                 \
  ABSL_PREDICT_TRUE(condition)                                           \
  ? (void)0                                                              \
  : ::enclient::logging_internal::LogMessageVoidify() &                  \
        ::enclient::logging_internal::LogMessageFatal(__FILE__, __LINE__, \
                                                      #condition)         \
            .stream()

#define CHECK_EQ(a, b) CHECK((a) == (b))
#define CHECK_NE(a, b) CHECK((a) != (b))
#define CHECK_LT(a, b) CHECK((a) < (b))
#define CHECK_LE(a, b) CHECK((a) <= (b))
#define CHECK_GT(a, b) CHECK((a) > (b))
#define CHECK_GE(a, b) CHECK((a) >= (b))
#define CHECK_OK(expr) CHECK((expr).ok())

#ifndef NDEBUG
#define DCHECK(condition) CHECK(condition)
#else
#define DCHECK(condition) \
  while (false) CHECK(condition)
#endif

#define DCHECK_EQ(a, b) DCHECK((a) == (b))
#define DCHECK_GE(a, b) DCHECK((a) >= (b))
#define DCHECK_LT(a, b) DCHECK((a) < (b))

#endif  // EXPOSURE_NOTIFICATION_CLIENT_PORT_LOGGING_H_
