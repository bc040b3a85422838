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

#ifndef OMFILE_INTERNAL_OS_ERROR_CODE_H_
#define OMFILE_INTERNAL_OS_ERROR_CODE_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace omfile {
namespace internal_os {

/// Returns the error message associated with an `errno` value.
std::string GetOsErrorMessage(int error_code);

/// Returns an `absl::Status` for the `errno` value `error_code`.  The
/// message is the concatenation of `parts` followed by the OS message.
template <typename... Part>
absl::Status StatusFromOsError(int error_code, const Part&... parts) {
  return absl::Status(
      absl::ErrnoToStatusCode(error_code),
      absl::StrCat(parts..., " [OS error ", error_code, ": ",
                   GetOsErrorMessage(error_code), "]"));
}

}  // namespace internal_os
}  // namespace omfile

#endif  // OMFILE_INTERNAL_OS_ERROR_CODE_H_
