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

#ifndef OMFILE_UTIL_STR_CAT_H_
#define OMFILE_UTIL_STR_CAT_H_

/// \file
/// Provides generic conversion to string representation.

#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/strings/str_cat.h"

namespace omfile {
namespace internal_strcat {

template <typename T, typename = void>
constexpr inline bool IsOstreamable = false;

template <typename T>
constexpr inline bool IsOstreamable<
    T, std::void_t<decltype(std::declval<std::ostream&>()
                            << std::declval<const T&>())>> = true;

/// Converts arbitrary input values to a type supported by `absl::StrCat`.
template <typename T>
auto ToAlphaNumOrString(const T& x);

/// Converts the argument to a string representation using `operator<<`.
template <typename T>
std::string StringifyUsingOstream(const T& x) {
  std::ostringstream ostr;
  ostr << x;
  return ostr.str();
}

/// Converts container<T> values to strings.
template <typename Iterator>
std::string StringifyContainer(Iterator begin, Iterator end) {
  std::string result = "{";
  if (begin != end) {
    absl::StrAppend(&result, ToAlphaNumOrString(*begin++));
  }
  for (; begin != end; ++begin) {
    absl::StrAppend(&result, ", ", ToAlphaNumOrString(*begin));
  }
  absl::StrAppend(&result, "}");
  return result;
}

template <typename T>
auto ToAlphaNumOrString(const T& x) {
  if constexpr (std::is_convertible_v<T, absl::AlphaNum> &&
                !std::is_enum_v<T>) {
    return x;
  } else if constexpr (IsOstreamable<T>) {
    return StringifyUsingOstream(x);
  } else {
    // Containers such as `absl::Span<const Range>`.
    return StringifyContainer(x.begin(), x.end());
  }
}

}  // namespace internal_strcat

/// Concatenates the string representation of `arg...` and returns the result.
///
/// Strings and numbers are converted as by `absl::StrCat`; enums, byte
/// ranges and other types are converted with `operator<<`; containers print
/// as `{a, b, c}`.
///
/// \ingroup string-utilities
template <typename... Arg>
std::string StrCat(const Arg&... arg) {
  return absl::StrCat(internal_strcat::ToAlphaNumOrString(arg)...);
}

/// Appends a string representation of arg... to `*result`.
///
/// \ingroup string-utilities
template <typename... Arg>
void StrAppend(std::string* result, const Arg&... arg) {
  return absl::StrAppend(result, internal_strcat::ToAlphaNumOrString(arg)...);
}

}  // namespace omfile

#endif  // OMFILE_UTIL_STR_CAT_H_
