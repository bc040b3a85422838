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

#ifndef OMFILE_FORMAT_VARIABLE_H_
#define OMFILE_FORMAT_VARIABLE_H_

/// \file
/// Parsed metadata record of one variable.
///
/// A trailer-addressed file stores one record per variable, little-endian:
///
///     u8  data_type
///     u8  compression
///     u16 name_length
///     u32 child_count
///     f64 scale_factor
///     f64 add_offset
///     u64 rank
///     u64 dimensions[rank]
///     u64 chunks[rank]
///     u64 index_offset          absolute offset of the chunk index table
///     u64 child_offset, u64 child_size   (child_count times)
///     u8  name[name_length]
///     payload                   scalars only
///
/// The payload of a numeric scalar is its little-endian value; the payload
/// of a string is `u64 length` followed by the bytes.

#include <stddef.h>
#include <stdint.h>

#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "absl/base/casts.h"
#include "absl/base/internal/endian.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/format/chunk_index.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"
#include "omfile/util/result.h"

namespace omfile {
namespace internal_format {

/// Decodes a little-endian numeric value of type `T` from `p`.
template <typename T>
T LoadLittleEndian(const char* p) {
  if constexpr (sizeof(T) == 1) {
    return static_cast<T>(*p);
  } else if constexpr (sizeof(T) == 2) {
    return absl::bit_cast<T>(absl::little_endian::Load16(p));
  } else if constexpr (sizeof(T) == 4) {
    return absl::bit_cast<T>(absl::little_endian::Load32(p));
  } else {
    static_assert(sizeof(T) == 8);
    return absl::bit_cast<T>(absl::little_endian::Load64(p));
  }
}

/// Decodes a scalar payload.
template <typename T>
Result<T> DecodeScalarPayload(std::string_view payload) {
  if constexpr (std::is_same_v<T, std::string>) {
    if (payload.size() < 8) {
      return DecodeError("String payload is missing its length");
    }
    const uint64_t length = absl::little_endian::Load64(payload.data());
    if (length != payload.size() - 8) {
      return DecodeError(absl::StrCat("String payload of length ", length,
                                      " has ", payload.size() - 8,
                                      " bytes"));
    }
    return std::string(payload.substr(8));
  } else {
    static_assert(std::is_arithmetic_v<T>);
    if (payload.size() != sizeof(T)) {
      return DecodeError(absl::StrCat("Expected ", sizeof(T),
                                      " payload bytes, but received ",
                                      payload.size()));
    }
    return LoadLittleEndian<T>(payload.data());
  }
}

}  // namespace internal_format

/// Metadata of a variable: a scalar value, an array description, or a group
/// (`DataType::kNone`) whose only content is its children.
///
/// Holds a copy of the raw record, from which the name, children and scalar
/// payload are decoded on access.
class Variable {
 public:
  /// Size of the fixed part of a metadata record, up to the dimensions.
  static constexpr size_t kFixedSize = 32;

  /// Largest decoded size, in bytes, of a single chunk.  Records whose
  /// chunks exceed it are rejected by `Parse` and `FromLegacyHeader`.
  static constexpr uint64_t kMaxChunkSize = uint64_t{1} << 30;

  /// Parses a metadata record of a trailer-addressed file.
  ///
  /// \error `ErrorKind::kDecodeError` if the record is truncated, has
  ///     unknown tags, or violates the structural invariants: arrays have at
  ///     least one dimension, `dimensions().size() == chunks().size()` and
  ///     every chunk extent is at least 1; scalars and groups have no
  ///     dimensions.
  static Result<Variable> Parse(absl::Cord record);

  /// Builds the variable described by the header of a legacy file: a 2D
  /// `kFloatArray` with no name and no children.
  ///
  /// \error `ErrorKind::kDecodeError` if the header is malformed.
  static Result<Variable> FromLegacyHeader(const absl::Cord& header);

  DataType data_type() const { return data_type_; }
  CompressionType compression() const { return compression_; }
  double scale_factor() const { return scale_factor_; }
  double add_offset() const { return add_offset_; }
  absl::Span<const uint64_t> dimensions() const { return dimensions_; }
  absl::Span<const uint64_t> chunks() const { return chunks_; }

  std::optional<std::string_view> name() const {
    if (name_length_ == 0) return std::nullopt;
    return std::string_view(record_).substr(name_offset_, name_length_);
  }

  uint64_t child_count() const { return child_count_; }

  /// \error `ErrorKind::kIndexOutOfRange` if `index >= child_count()`.
  Result<OffsetSize> child_location(uint64_t index) const;

  /// Number of chunks along each dimension.
  std::vector<uint64_t> chunk_grid_shape() const;

  /// Layout of the chunk index table.
  ///
  /// \pre `IsArray(data_type())`
  const ChunkIndexLayout& chunk_index() const { return chunk_index_; }

  /// Returns the scalar value, or `std::nullopt` if the variable is not a
  /// scalar of type `T`.
  ///
  /// \error `ErrorKind::kDecodeError` if the payload is malformed.
  template <typename T>
  Result<std::optional<T>> ReadScalar() const {
    if (data_type_ != kScalarDataType<T>) return std::nullopt;
    OMFILE_ASSIGN_OR_RETURN(
        T value, internal_format::DecodeScalarPayload<T>(payload()),
        MaybeAnnotateStatus(_, "Decoding scalar payload"));
    return value;
  }

  /// Size in bytes of the metadata record held by this variable.
  size_t record_size() const { return record_.size(); }

 private:
  std::string_view payload() const {
    return std::string_view(record_).substr(payload_offset_);
  }

  absl::Status Validate() const;

  std::string record_;
  DataType data_type_ = DataType::kNone;
  CompressionType compression_ = CompressionType::kNone;
  double scale_factor_ = 1;
  double add_offset_ = 0;
  std::vector<uint64_t> dimensions_;
  std::vector<uint64_t> chunks_;
  uint64_t child_count_ = 0;
  size_t children_offset_ = 0;
  size_t name_offset_ = 0;
  size_t name_length_ = 0;
  size_t payload_offset_ = 0;
  ChunkIndexLayout chunk_index_;
};

}  // namespace omfile

#endif  // OMFILE_FORMAT_VARIABLE_H_
