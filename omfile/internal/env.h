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

#ifndef OMFILE_INTERNAL_ENV_H_
#define OMFILE_INTERNAL_ENV_H_

#include <optional>
#include <string>
#include <type_traits>

#include "absl/base/attributes.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"

namespace omfile {
namespace internal {

// Returns the value of an environment variable or empty.
std::optional<std::string> GetEnv(char const* variable);

// Sets environment variable `variable` to `value`.
void SetEnv(const char* variable, const char* value);

// Removes environment variable `variable`.
void UnsetEnv(const char* variable);

// Returns the parsed value of an environment variable or empty.
//
// Only strings, booleans and integers are supported; an unparsable value is
// logged and treated as unset.
template <typename T>
std::optional<T> GetEnvValue(const char* variable) {
  static_assert(std::is_same_v<std::string, T> || std::is_integral_v<T>);
  auto env = internal::GetEnv(variable);
  if (!env) return std::nullopt;
  if constexpr (std::is_same_v<std::string, T>) {
    return env;
  } else if constexpr (std::is_same_v<bool, T>) {
    T n;
    if (absl::SimpleAtob(*env, &n)) return n;
  } else {
    T n;
    if (absl::SimpleAtoi(*env, &n)) return n;
  }
  ABSL_LOG(WARNING) << "Failed to parse " << variable << " as a value: "
                    << *env;
  return std::nullopt;
}

// Returns the value of `flag` if set, otherwise the parsed value of the
// environment variable `variable`, or empty.
template <typename T>
ABSL_MUST_USE_RESULT std::optional<T> GetFlagOrEnvValue(
    absl::Flag<std::optional<T>>& flag, const char* variable) {
  if (auto val = absl::GetFlag(flag); val.has_value()) return val;
  return internal::GetEnvValue<T>(variable);
}

}  // namespace internal
}  // namespace omfile

#endif  // OMFILE_INTERNAL_ENV_H_
