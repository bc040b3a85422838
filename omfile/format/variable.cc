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

#include "omfile/format/variable.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/casts.h"
#include "absl/base/internal/endian.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_join.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/format/chunk_index.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"
#include "omfile/format/header.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"
#include "omfile/util/str_cat.h"

namespace omfile {
namespace {

constexpr size_t kChildEntrySize = 16;

// Offsets within the legacy header.
constexpr size_t kLegacyCompressionOffset = 3;
constexpr size_t kLegacyScaleFactorOffset = 4;
constexpr size_t kLegacyDimensionsOffset = 8;
constexpr size_t kLegacyChunksOffset = 24;

// Returns the number of chunks of a grid, or an error if it overflows.
Result<uint64_t> GetNumChunks(absl::Span<const uint64_t> dimensions,
                              absl::Span<const uint64_t> chunks) {
  uint64_t n = 1;
  for (size_t i = 0; i < dimensions.size(); ++i) {
    const uint64_t extent =
        dimensions[i] / chunks[i] + (dimensions[i] % chunks[i] != 0);
    if (extent != 0 && n > std::numeric_limits<uint64_t>::max() / extent) {
      return DecodeError(omfile::StrCat("Chunk grid of [",
                                        absl::StrJoin(dimensions, ","),
                                        "] overflows"));
    }
    n *= extent;
  }
  return n;
}

}  // namespace

Result<Variable> Variable::Parse(absl::Cord record) {
  Variable v;
  v.record_ = std::string(record);
  const std::string& r = v.record_;
  if (r.size() < kFixedSize) {
    return DecodeError(omfile::StrCat("Metadata record of ", r.size(),
                                      " bytes is shorter than ", kFixedSize));
  }
  const char* p = r.data();
  const uint8_t data_type = static_cast<uint8_t>(p[0]);
  const uint8_t compression = static_cast<uint8_t>(p[1]);
  if (!IsValidDataTypeTag(data_type)) {
    return DecodeError(
        omfile::StrCat("Unknown data type tag ", static_cast<int>(data_type)));
  }
  if (!IsValidCompressionTypeTag(compression)) {
    return DecodeError(omfile::StrCat("Unknown compression tag ",
                                      static_cast<int>(compression)));
  }
  v.data_type_ = static_cast<DataType>(data_type);
  v.compression_ = static_cast<CompressionType>(compression);
  v.name_length_ = absl::little_endian::Load16(p + 2);
  v.child_count_ = absl::little_endian::Load32(p + 4);
  v.scale_factor_ =
      absl::bit_cast<double>(absl::little_endian::Load64(p + 8));
  v.add_offset_ = absl::bit_cast<double>(absl::little_endian::Load64(p + 16));
  const uint64_t rank = absl::little_endian::Load64(p + 24);

  // Everything up to the payload must fit in the record.
  const size_t remaining = r.size() - kFixedSize;
  if (remaining < 8 || rank > (remaining - 8) / 16) {
    return DecodeError(omfile::StrCat("Metadata record of ", r.size(),
                                      " bytes is too short for rank ", rank));
  }
  size_t pos = kFixedSize;
  const size_t required = rank * 16 + 8 + v.child_count_ * kChildEntrySize +
                          v.name_length_;
  if (required > remaining) {
    return DecodeError(omfile::StrCat("Metadata record of ", r.size(),
                                      " bytes is truncated; expected at least ",
                                      kFixedSize + required));
  }
  v.dimensions_.resize(rank);
  v.chunks_.resize(rank);
  for (uint64_t i = 0; i < rank; ++i, pos += 8) {
    v.dimensions_[i] = absl::little_endian::Load64(p + pos);
  }
  for (uint64_t i = 0; i < rank; ++i, pos += 8) {
    v.chunks_[i] = absl::little_endian::Load64(p + pos);
  }
  const uint64_t index_offset = absl::little_endian::Load64(p + pos);
  pos += 8;
  v.children_offset_ = pos;
  pos += v.child_count_ * kChildEntrySize;
  v.name_offset_ = pos;
  pos += v.name_length_;
  v.payload_offset_ = pos;

  OMFILE_RETURN_IF_ERROR(v.Validate());
  if (IsArray(v.data_type_)) {
    if (v.payload_offset_ != r.size()) {
      return DecodeError(omfile::StrCat("Array metadata record has ",
                                        r.size() - v.payload_offset_,
                                        " unexpected trailing bytes"));
    }
    OMFILE_ASSIGN_OR_RETURN(uint64_t num_chunks,
                            GetNumChunks(v.dimensions_, v.chunks_));
    OMFILE_ASSIGN_OR_RETURN(
        v.chunk_index_,
        ChunkIndexLayout::Make(ChunkIndexLayout::Encoding::kOffsetLength,
                               index_offset, num_chunks));
  }
  return v;
}

Result<Variable> Variable::FromLegacyHeader(const absl::Cord& header) {
  if (header.size() < kHeaderSize) {
    return DecodeError(omfile::StrCat("Legacy header of ", header.size(),
                                      " bytes is shorter than ", kHeaderSize));
  }
  Variable v;
  v.record_ = std::string(header.Subcord(0, kHeaderSize));
  const char* p = v.record_.data();
  const uint8_t version = static_cast<uint8_t>(p[2]);
  if (version == kLegacyVersion1) {
    v.compression_ = CompressionType::kPforDelta2dInt16;
  } else if (version == kLegacyVersion2) {
    const uint8_t compression =
        static_cast<uint8_t>(p[kLegacyCompressionOffset]);
    if (!IsValidCompressionTypeTag(compression)) {
      return DecodeError(omfile::StrCat("Unknown compression tag ",
                                        static_cast<int>(compression)));
    }
    v.compression_ = static_cast<CompressionType>(compression);
  } else {
    return DecodeError(omfile::StrCat("Unsupported legacy version ",
                                      static_cast<int>(version)));
  }
  v.data_type_ = DataType::kFloatArray;
  v.scale_factor_ = absl::bit_cast<float>(
      absl::little_endian::Load32(p + kLegacyScaleFactorOffset));
  v.add_offset_ = 0;
  for (size_t i = 0; i < 2; ++i) {
    v.dimensions_.push_back(
        absl::little_endian::Load64(p + kLegacyDimensionsOffset + 8 * i));
    v.chunks_.push_back(
        absl::little_endian::Load64(p + kLegacyChunksOffset + 8 * i));
  }
  v.payload_offset_ = v.record_.size();
  OMFILE_RETURN_IF_ERROR(v.Validate());
  OMFILE_ASSIGN_OR_RETURN(uint64_t num_chunks,
                          GetNumChunks(v.dimensions_, v.chunks_));
  OMFILE_ASSIGN_OR_RETURN(
      v.chunk_index_,
      ChunkIndexLayout::Make(ChunkIndexLayout::Encoding::kLegacyEndOffsets,
                             kHeaderSize, num_chunks));
  return v;
}

absl::Status Variable::Validate() const {
  if (IsArray(data_type_)) {
    if (dimensions_.empty()) {
      return DecodeError("Array variable has no dimensions");
    }
    for (size_t i = 0; i < chunks_.size(); ++i) {
      if (chunks_[i] == 0) {
        return DecodeError(
            omfile::StrCat("Chunk extent of dimension ", i, " is 0"));
      }
    }
    const uint64_t element_size =
        std::max<uint64_t>(1, ElementSize(ElementDataType(data_type_)));
    const uint64_t max_elements = kMaxChunkSize / element_size;
    uint64_t chunk_elements = 1;
    for (size_t i = 0; i < chunks_.size(); ++i) {
      // Chunks never extend past the array, so only the clipped extent is
      // ever decoded.
      const uint64_t extent = std::min(chunks_[i], dimensions_[i]);
      if (extent != 0 && chunk_elements > max_elements / extent) {
        return DecodeError(omfile::StrCat(
            "Chunk shape ", chunks_, " exceeds ", kMaxChunkSize,
            " bytes for dimensions ", dimensions_));
      }
      chunk_elements *= extent;
    }
  } else if (!dimensions_.empty()) {
    return DecodeError(omfile::StrCat("Variable of type ", data_type_, " has ",
                                      dimensions_.size(), " dimensions"));
  }
  return absl::OkStatus();
}

Result<OffsetSize> Variable::child_location(uint64_t index) const {
  if (index >= child_count_) {
    return IndexOutOfRangeError(omfile::StrCat(
        "Child index ", index, " is out of range for ", child_count_,
        " children"));
  }
  const char* p = record_.data() + children_offset_ + index * kChildEntrySize;
  OffsetSize location{absl::little_endian::Load64(p),
                      absl::little_endian::Load64(p + 8)};
  if (location.Overflows()) {
    return DecodeError(
        omfile::StrCat("Child ", index, " location ", location, " overflows"));
  }
  return location;
}

std::vector<uint64_t> Variable::chunk_grid_shape() const {
  std::vector<uint64_t> shape(dimensions_.size());
  for (size_t i = 0; i < shape.size(); ++i) {
    shape[i] =
        dimensions_[i] / chunks_[i] + (dimensions_[i] % chunks_[i] != 0);
  }
  return shape;
}

}  // namespace omfile
