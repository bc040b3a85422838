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

#ifndef OMFILE_UTIL_RESULT_H_
#define OMFILE_UTIL_RESULT_H_

#include <type_traits>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "omfile/util/status.h"

namespace omfile {

/// `Result<T>` holds either a value of type `T` or an error `absl::Status`.
///
/// \ingroup error handling
template <typename T>
using Result = absl::StatusOr<T>;

template <typename T>
constexpr inline bool IsResult = false;

template <typename T>
constexpr inline bool IsResult<absl::StatusOr<T>> = true;

/// Returns the error status of `result`, or `absl::OkStatus()`.
///
/// \relates Result
/// \id result
template <typename T>
inline const absl::Status& GetStatus(const Result<T>& result) {
  return result.status();
}
template <typename T>
inline absl::Status GetStatus(Result<T>&& result) {
  return std::move(result).status();
}

}  // namespace omfile

#define OMFILE_INTERNAL_PP_CAT_IMPL(a, b) a##b
#define OMFILE_INTERNAL_PP_CAT(a, b) OMFILE_INTERNAL_PP_CAT_IMPL(a, b)

#define OMFILE_INTERNAL_ASSIGN_OR_RETURN_IMPL(temp, decl, expr, error_expr, \
                                              ...)                         \
  auto temp = (expr);                                                      \
  static_assert(::omfile::IsResult<decltype(temp)>,                        \
                "OMFILE_ASSIGN_OR_RETURN requires a Result value.");       \
  if (ABSL_PREDICT_FALSE(!temp.ok())) {                                    \
    auto _ = std::move(temp).status();                                     \
    static_cast<void>(_);                                                  \
    return (error_expr);                                                   \
  }                                                                        \
  decl = std::move(*temp);                                                 \
  /**/

/// Convenience macro for propagating errors when calling a function that
/// returns a `omfile::Result`.
///
/// This macro generates multiple statements and should be invoked as follows::
///
///     Result<int> GetSomeResult();
///
///     OMFILE_ASSIGN_OR_RETURN(int x, GetSomeResult());
///
/// An optional third argument specifies the return expression in the case of an
/// error.  A variable ``_`` bound to the error `absl::Status` value is in
/// scope within this expression.  For example::
///
///     OMFILE_ASSIGN_OR_RETURN(int x, GetSomeResult(),
///                             MaybeAnnotateStatus(_, "Context message"));
///
/// \relates omfile::Result
#define OMFILE_ASSIGN_OR_RETURN(decl, ...)                                   \
  OMFILE_INTERNAL_ASSIGN_OR_RETURN_IMPL(                                     \
      OMFILE_INTERNAL_PP_CAT(omfile_assign_or_return_, __LINE__), decl,      \
      __VA_ARGS__, _)                                                        \
  /**/

#endif  // OMFILE_UTIL_RESULT_H_
