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

#ifndef OMFILE_ERRORS_H_
#define OMFILE_ERRORS_H_

/// \file
/// Error kinds reported by the reader.
///
/// Every error produced by this library is an `absl::Status`.  Besides its
/// status code, it carries an `ErrorKind` in a payload so that callers can
/// tell, for example, a `RangeOutOfBounds` request from a corrupt chunk
/// index.  Errors returned by a `ByteRangeSource` are forwarded unchanged
/// and carry no kind.

#include <iosfwd>
#include <optional>
#include <string_view>

#include "absl/status/status.h"

namespace omfile {

enum class ErrorKind {
  /// The file header does not identify a known format.
  kInvalidFormat,
  /// The trailer at the end of the file is malformed.
  kInvalidTrailer,
  /// The reader was used before `Initialize` or after `Dispose`.
  kNotInitialized,
  /// The number of requested ranges differs from the variable rank.
  kDimensionMismatch,
  /// A requested range is inverted or exceeds the dimension extent.
  kRangeOutOfBounds,
  /// The output buffer is smaller than the requested region.
  kBufferTooSmall,
  /// A child index is not less than the child count.
  kIndexOutOfRange,
  /// A metadata record, chunk index or chunk payload is corrupt.
  kDecodeError,
  /// The requested element type differs from the stored data type.
  kDataTypeMismatch,
};

std::string_view ErrorKindToString(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

/// Payload URL under which the kind is stored.
constexpr std::string_view kErrorKindPayload = "omfile.error_kind";

/// Returns an error status of the code associated with `kind`.
absl::Status MakeError(ErrorKind kind, std::string_view message);

/// Returns the kind attached to `status`, or `std::nullopt` for OK statuses
/// and errors that did not originate in this library.
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

inline absl::Status InvalidFormatError(std::string_view message) {
  return MakeError(ErrorKind::kInvalidFormat, message);
}
inline absl::Status InvalidTrailerError(std::string_view message) {
  return MakeError(ErrorKind::kInvalidTrailer, message);
}
inline absl::Status NotInitializedError(std::string_view message) {
  return MakeError(ErrorKind::kNotInitialized, message);
}
inline absl::Status DimensionMismatchError(std::string_view message) {
  return MakeError(ErrorKind::kDimensionMismatch, message);
}
inline absl::Status RangeOutOfBoundsError(std::string_view message) {
  return MakeError(ErrorKind::kRangeOutOfBounds, message);
}
inline absl::Status BufferTooSmallError(std::string_view message) {
  return MakeError(ErrorKind::kBufferTooSmall, message);
}
inline absl::Status IndexOutOfRangeError(std::string_view message) {
  return MakeError(ErrorKind::kIndexOutOfRange, message);
}
inline absl::Status DecodeError(std::string_view message) {
  return MakeError(ErrorKind::kDecodeError, message);
}
inline absl::Status DataTypeMismatchError(std::string_view message) {
  return MakeError(ErrorKind::kDataTypeMismatch, message);
}

/// Converts an error from a lower layer (such as zlib) into a
/// `kDecodeError`, keeping its message.
absl::Status AsDecodeError(const absl::Status& status,
                           std::string_view context);

}  // namespace omfile

#endif  // OMFILE_ERRORS_H_
