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

#include "omfile/errors.h"

#include <optional>
#include <ostream>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace omfile {
namespace {

constexpr ErrorKind kAllKinds[] = {
    ErrorKind::kInvalidFormat,     ErrorKind::kInvalidTrailer,
    ErrorKind::kNotInitialized,    ErrorKind::kDimensionMismatch,
    ErrorKind::kRangeOutOfBounds,  ErrorKind::kBufferTooSmall,
    ErrorKind::kIndexOutOfRange,   ErrorKind::kDecodeError,
    ErrorKind::kDataTypeMismatch,
};

absl::StatusCode CodeForKind(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidFormat:
    case ErrorKind::kDimensionMismatch:
    case ErrorKind::kBufferTooSmall:
    case ErrorKind::kDataTypeMismatch:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kInvalidTrailer:
    case ErrorKind::kDecodeError:
      return absl::StatusCode::kDataLoss;
    case ErrorKind::kNotInitialized:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kRangeOutOfBounds:
    case ErrorKind::kIndexOutOfRange:
      return absl::StatusCode::kOutOfRange;
  }
  return absl::StatusCode::kUnknown;
}

}  // namespace

std::string_view ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidFormat:
      return "InvalidFormat";
    case ErrorKind::kInvalidTrailer:
      return "InvalidTrailer";
    case ErrorKind::kNotInitialized:
      return "NotInitialized";
    case ErrorKind::kDimensionMismatch:
      return "DimensionMismatch";
    case ErrorKind::kRangeOutOfBounds:
      return "RangeOutOfBounds";
    case ErrorKind::kBufferTooSmall:
      return "BufferTooSmall";
    case ErrorKind::kIndexOutOfRange:
      return "IndexOutOfRange";
    case ErrorKind::kDecodeError:
      return "DecodeError";
    case ErrorKind::kDataTypeMismatch:
      return "DataTypeMismatch";
  }
  return "<unknown>";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << ErrorKindToString(kind);
}

absl::Status MakeError(ErrorKind kind, std::string_view message) {
  absl::Status status(CodeForKind(kind), message);
  status.SetPayload(kErrorKindPayload, absl::Cord(ErrorKindToString(kind)));
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) return std::nullopt;
  auto payload = status.GetPayload(kErrorKindPayload);
  if (!payload) return std::nullopt;
  for (ErrorKind kind : kAllKinds) {
    if (*payload == ErrorKindToString(kind)) return kind;
  }
  return std::nullopt;
}

absl::Status AsDecodeError(const absl::Status& status,
                           std::string_view context) {
  if (status.ok()) return status;
  return DecodeError(absl::StrCat(context, ": ", status.message()));
}

}  // namespace omfile
