// Copyright 2025 The TensorStore Authors
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

#ifndef OMFILE_UTIL_STATUS_H_
#define OMFILE_UTIL_STATUS_H_

#include <optional>
#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

namespace omfile {
namespace internal {

absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code);

[[noreturn]] void FatalStatus(const char* message, const absl::Status& status,
                              const char* file, int line);

/// If status is not `absl::StatusCode::kOk`, then converts the status code.
inline absl::Status MaybeConvertStatusTo(absl::Status status,
                                         absl::StatusCode code) {
  if (status.code() == code) return status;
  return MaybeAnnotateStatusImpl(std::move(status), {}, code);
}

}  // namespace internal

/// If status is not `absl::StatusCode::kOk`, then annotate the status message.
///
/// Payloads attached to `source` are preserved, which keeps the error kind
/// reported by `GetErrorKind` intact across annotation.
///
/// \ingroup error handling
inline absl::Status MaybeAnnotateStatus(absl::Status source,
                                        std::string_view message) {
  return internal::MaybeAnnotateStatusImpl(std::move(source), message,
                                           std::nullopt);
}

/// Overload for the case of a bare absl::Status argument.
///
/// \returns `status`
/// \relates Result
/// \id status
inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}

}  // namespace omfile

/// Causes the containing function to return the specified `absl::Status` value
/// if it is an error status.
///
/// Example::
///
///     absl::Status GetSomeStatus();
///
///     absl::Status Bar() {
///       OMFILE_RETURN_IF_ERROR(GetSomeStatus());
///       // More code
///       return absl::OkStatus();
///     }
///
/// An optional second argument specifies the return expression in the case of
/// an error.  A variable ``_`` is bound to the value of the first expression
/// is in scope within this expression.  For example::
///
///     OMFILE_RETURN_IF_ERROR(GetSomeStatus(),
///                            MaybeAnnotateStatus(_, "In Bar"));
///
/// .. warning::
///
///    The `absl::Status` expression must not contain any commas outside
///    parentheses (such as in a template argument list); if necessary, to
///    ensure this, it may be wrapped in additional parentheses as needed.
///
/// \ingroup error handling
#define OMFILE_RETURN_IF_ERROR(...) \
  OMFILE_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _)

#define OMFILE_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::omfile::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                \
  return error_expr /**/

/// Logs an error and terminates the program if the specified `absl::Status` is
/// an error status.
///
/// \ingroup error handling
#define OMFILE_CHECK_OK(...)                                               \
  do {                                                                     \
    [](const ::absl::Status& omfile_check_ok_condition) {                  \
      if (ABSL_PREDICT_FALSE(!omfile_check_ok_condition.ok())) {           \
        ::omfile::internal::FatalStatus("Status not ok: " #__VA_ARGS__,    \
                                        omfile_check_ok_condition,         \
                                        __FILE__, __LINE__);               \
      }                                                                    \
    }(::omfile::GetStatus((__VA_ARGS__)));                                 \
  } while (false)

#endif  // OMFILE_UTIL_STATUS_H_
