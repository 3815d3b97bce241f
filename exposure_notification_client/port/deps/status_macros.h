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

#ifndef EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_STATUS_MACROS_H_
#define EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "exposure_notification_client/port/deps/source_location.h"
#include "exposure_notification_client/port/deps/status_builder.h"

namespace enclient {
namespace status_macro_internal {

// Holds the result of the expression given to ENCLIENT_RETURN_IF_ERROR so it
// can be declared and tested in the same `if`.
class StatusAdaptorForMacros {
 public:
  StatusAdaptorForMacros(absl::Status status, SourceLocation location)
      : builder_(std::move(status), location) {}
  StatusAdaptorForMacros(StatusBuilder builder, SourceLocation)
      : builder_(std::move(builder)) {}

  StatusAdaptorForMacros(const StatusAdaptorForMacros&) = delete;
  StatusAdaptorForMacros& operator=(const StatusAdaptorForMacros&) = delete;

  explicit operator bool() const { return ABSL_PREDICT_TRUE(builder_.ok()); }

  StatusBuilder&& Consume() { return std::move(builder_); }

 private:
  StatusBuilder builder_;
};

}  // namespace status_macro_internal
}  // namespace enclient

// Returns early from the enclosing function when `expr`, an absl::Status or
// StatusBuilder, is not OK. The returned value is a StatusBuilder, so context
// can be chained after the macro; the chain only runs on error:
//
//   ENCLIENT_RETURN_IF_ERROR(status_store_->SetExposureStatus(next))
//           .LogError()
//       << "while committing " << next;
//
// Lambdas using it need an explicit `-> absl::Status` return type.
#define ENCLIENT_RETURN_IF_ERROR(expr)                                  \
  ENCLIENT_STATUS_MACROS_IMPL_ELSE_BLOCKER_                             \
  if (::enclient::status_macro_internal::StatusAdaptorForMacros         \
          enclient_status_macro_adaptor = {(expr), ENCLIENT_LOC}) {     \
  } else /* NOLINT */                                                   \
    return enclient_status_macro_adaptor.Consume()

// ENCLIENT_ASSIGN_OR_RETURN(lhs, rexpr)
// ENCLIENT_ASSIGN_OR_RETURN(lhs, rexpr, error_expression)
//
// Evaluates `rexpr`, an absl::StatusOr<T>. On success moves the value into
// `lhs`, which may declare a new variable. On failure returns
// `error_expression`, in which `_` names a StatusBuilder holding the error:
//
//   ENCLIENT_ASSIGN_OR_RETURN(
//       RiskPolicy policy, risk_policy_provider_->GetRiskPolicy(),
//       _.SetErrorCode(absl::StatusCode::kFailedPrecondition).LogWarning());
//
// Expands to several statements, so it cannot be the unbraced body of an if.
#define ENCLIENT_ASSIGN_OR_RETURN(...)                                \
  ENCLIENT_STATUS_MACROS_IMPL_PICK_(                                  \
      __VA_ARGS__, ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_,   \
      ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_)                \
  (__VA_ARGS__)

#define ENCLIENT_STATUS_MACROS_IMPL_PICK_(_1, _2, _3, NAME, ...) NAME

#define ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_(lhs, rexpr) \
  ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr, std::move(_))

#define ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr,      \
                                                        error_expression) \
  ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                         \
      ENCLIENT_STATUS_MACROS_IMPL_JOIN_(enclient_status_or_, __LINE__),  \
      lhs, rexpr, error_expression)

#define ENCLIENT_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(result, lhs, rexpr,  \
                                                      error_expression)    \
  auto result = (rexpr);                                                   \
  if (ABSL_PREDICT_FALSE(!result.ok())) {                                  \
    ::enclient::StatusBuilder _(std::move(result).status(), ENCLIENT_LOC); \
    (void)_;                                                               \
    return (error_expression);                                             \
  }                                                                        \
  lhs = *std::move(result)

#define ENCLIENT_STATUS_MACROS_IMPL_JOIN_INNER_(a, b) a##b
#define ENCLIENT_STATUS_MACROS_IMPL_JOIN_(a, b) \
  ENCLIENT_STATUS_MACROS_IMPL_JOIN_INNER_(a, b)

// Keeps a trailing `else` in the caller from binding to the macro's `if`.
#define ENCLIENT_STATUS_MACROS_IMPL_ELSE_BLOCKER_ \
  switch (0)                                      \
  case 0:                                         \
  default:  // NOLINT

#endif  // EXPOSURE_NOTIFICATION_CLIENT_PORT_DEPS_STATUS_MACROS_H_
