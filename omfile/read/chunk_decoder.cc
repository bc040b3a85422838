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

#include "omfile/read/chunk_decoder.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "absl/base/casts.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "omfile/errors.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"
#include "omfile/format/variable.h"
#include "omfile/internal/compression/zlib.h"
#include "omfile/range.h"
#include "omfile/util/iterate_over_index_range.h"
#include "omfile/util/status.h"
#include "omfile/util/str_cat.h"

namespace omfile {
namespace {

template <typename T>
using BitsFor = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;

// Inflates `payload`, which must decode to exactly `size` bytes.
absl::Status Inflate(const absl::Cord& payload, size_t size,
                     std::string* output) {
  absl::Cord decoded;
  OMFILE_RETURN_IF_ERROR(zlib::Decode(payload, &decoded, size),
                         AsDecodeError(_, "Decoding chunk"));
  if (decoded.size() != size) {
    return DecodeError(omfile::StrCat("Chunk decoded to ", decoded.size(),
                                      " bytes, but expected ", size));
  }
  *output = std::string(decoded);
  return absl::OkStatus();
}

// Adds row `r - 1` to row `r` for every row, with wrapping arithmetic.
template <typename U>
void ReverseDelta2d(absl::Span<U> values, size_t rows, size_t cols) {
  static_assert(std::is_unsigned_v<U>);
  for (size_t r = 1; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      values[r * cols + c] =
          static_cast<U>(values[r * cols + c] + values[(r - 1) * cols + c]);
    }
  }
}

// XORs row `r - 1` into row `r` for every row.
template <typename U>
void ReverseXor2d(absl::Span<U> values, size_t rows, size_t cols) {
  for (size_t r = 1; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      values[r * cols + c] ^= values[(r - 1) * cols + c];
    }
  }
}

template <typename U>
std::vector<U> LoadAll(std::string_view bytes, size_t n) {
  std::vector<U> result(n);
  for (size_t i = 0; i < n; ++i) {
    result[i] = internal_format::LoadLittleEndian<U>(bytes.data() +
                                                     i * sizeof(U));
  }
  return result;
}

}  // namespace

template <typename T>
ChunkDecoder<T>::ChunkDecoder(const Variable& variable,
                              absl::Span<const Range> ranges,
                              absl::Span<T> output)
    : element_type_(ElementDataType(variable.data_type())),
      compression_(variable.compression()),
      scale_factor_(variable.scale_factor()),
      add_offset_(variable.add_offset()),
      dimensions_(variable.dimensions().begin(), variable.dimensions().end()),
      chunks_(variable.chunks().begin(), variable.chunks().end()),
      ranges_(ranges.begin(), ranges.end()),
      output_strides_(ranges.size()),
      output_(output) {
  uint64_t stride = 1;
  for (size_t i = ranges_.size(); i-- > 0;) {
    output_strides_[i] = stride;
    stride *= ranges_[i].size();
  }
}

template <typename T>
absl::Status ChunkDecoder<T>::DecodeChunk(
    absl::Span<const uint64_t> grid_position,
    const absl::Cord& payload) const {
  const size_t rank = dimensions_.size();
  if (grid_position.size() != rank) {
    return DecodeError(omfile::StrCat("Chunk position of rank ",
                                      grid_position.size(),
                                      " does not match variable rank ", rank));
  }
  std::vector<uint64_t> origin(rank), shape(rank);
  size_t num_elements = 1;
  for (size_t i = 0; i < rank; ++i) {
    origin[i] = grid_position[i] * chunks_[i];
    if (origin[i] >= dimensions_[i]) {
      return DecodeError(omfile::StrCat("Chunk ", grid_position,
                                        " is outside of the array"));
    }
    shape[i] = std::min(chunks_[i], dimensions_[i] - origin[i]);
    num_elements *= shape[i];
  }
  const size_t cols = shape[rank - 1];
  const size_t rows = num_elements / cols;
  std::vector<T> values(num_elements);
  OMFILE_RETURN_IF_ERROR(
      DecodeValues(payload, rows, cols, absl::MakeSpan(values)),
      MaybeAnnotateStatus(_, omfile::StrCat("Chunk ", grid_position)));
  Place(origin, shape, values);
  return absl::OkStatus();
}

template <typename T>
absl::Status ChunkDecoder<T>::DecodeValues(const absl::Cord& payload,
                                           size_t rows, size_t cols,
                                           absl::Span<T> values) const {
  if (element_type_ != kScalarDataType<T> ||
      !IsSupportedCombination(compression_, element_type_)) {
    return DecodeError(omfile::StrCat("Compression ", compression_,
                                      " is not supported for element type ",
                                      element_type_));
  }
  const size_t n = values.size();
  std::string bytes;
  switch (compression_) {
    case CompressionType::kNone: {
      if (payload.size() != n * sizeof(T)) {
        return DecodeError(
            omfile::StrCat("Uncompressed chunk has ", payload.size(),
                           " bytes, but expected ", n * sizeof(T)));
      }
      bytes = std::string(payload);
      auto raw = LoadAll<T>(bytes, n);
      std::copy(raw.begin(), raw.end(), values.begin());
      return absl::OkStatus();
    }
    case CompressionType::kPforDelta2dInt16:
    case CompressionType::kPforDelta2dInt16Logarithmic: {
      if constexpr (std::is_floating_point_v<T>) {
        OMFILE_RETURN_IF_ERROR(Inflate(payload, n * sizeof(int16_t), &bytes));
        auto encoded = LoadAll<uint16_t>(bytes, n);
        ReverseDelta2d(absl::MakeSpan(encoded), rows, cols);
        const bool logarithmic =
            compression_ == CompressionType::kPforDelta2dInt16Logarithmic;
        const T scale = static_cast<T>(scale_factor_);
        const T offset = static_cast<T>(add_offset_);
        for (size_t i = 0; i < n; ++i) {
          const int16_t x = static_cast<int16_t>(encoded[i]);
          if (x == std::numeric_limits<int16_t>::max()) {
            values[i] = std::numeric_limits<T>::quiet_NaN();
            continue;
          }
          T v = static_cast<T>(x) / scale - offset;
          if (logarithmic) v = std::pow(T(10), v) - 1;
          values[i] = v;
        }
        return absl::OkStatus();
      }
      break;
    }
    case CompressionType::kFpxXor2d: {
      if constexpr (std::is_floating_point_v<T>) {
        using Bits = BitsFor<T>;
        OMFILE_RETURN_IF_ERROR(Inflate(payload, n * sizeof(Bits), &bytes));
        auto encoded = LoadAll<Bits>(bytes, n);
        ReverseXor2d(absl::MakeSpan(encoded), rows, cols);
        for (size_t i = 0; i < n; ++i) {
          values[i] = absl::bit_cast<T>(encoded[i]);
        }
        return absl::OkStatus();
      }
      break;
    }
    case CompressionType::kPforDelta2d: {
      if constexpr (std::is_integral_v<T>) {
        using U = std::make_unsigned_t<T>;
        OMFILE_RETURN_IF_ERROR(Inflate(payload, n * sizeof(U), &bytes));
        auto encoded = LoadAll<U>(bytes, n);
        ReverseDelta2d(absl::MakeSpan(encoded), rows, cols);
        for (size_t i = 0; i < n; ++i) {
          values[i] = static_cast<T>(encoded[i]);
        }
        return absl::OkStatus();
      }
      break;
    }
  }
  return DecodeError(omfile::StrCat("Compression ", compression_,
                                    " is not supported for element type ",
                                    element_type_));
}

template <typename T>
void ChunkDecoder<T>::Place(absl::Span<const uint64_t> chunk_origin,
                            absl::Span<const uint64_t> chunk_shape,
                            absl::Span<const T> values) const {
  const size_t rank = chunk_origin.size();
  std::vector<uint64_t> chunk_strides(rank);
  std::vector<uint64_t> lo(rank), hi(rank), extent(rank);
  uint64_t stride = 1;
  for (size_t i = rank; i-- > 0;) {
    chunk_strides[i] = stride;
    stride *= chunk_shape[i];
    lo[i] = std::max(chunk_origin[i], ranges_[i].start);
    hi[i] = std::min(chunk_origin[i] + chunk_shape[i], ranges_[i].end);
    if (lo[i] >= hi[i]) return;
    extent[i] = hi[i] - lo[i];
  }
  const size_t last = rank - 1;
  const size_t run = extent[last];
  // Copy one contiguous run along the last dimension per outer position.
  IterateOverIndexRange(
      absl::MakeConstSpan(lo).first(last),
      absl::MakeConstSpan(extent).first(last),
      [&](absl::Span<const uint64_t> pos) {
        uint64_t src = lo[last] - chunk_origin[last];
        uint64_t dst = lo[last] - ranges_[last].start;
        for (size_t i = 0; i < last; ++i) {
          src += (pos[i] - chunk_origin[i]) * chunk_strides[i];
          dst += (pos[i] - ranges_[i].start) * output_strides_[i];
        }
        std::copy_n(values.begin() + src, run, output_.begin() + dst);
      });
}

template class ChunkDecoder<int8_t>;
template class ChunkDecoder<uint8_t>;
template class ChunkDecoder<int16_t>;
template class ChunkDecoder<uint16_t>;
template class ChunkDecoder<int32_t>;
template class ChunkDecoder<uint32_t>;
template class ChunkDecoder<int64_t>;
template class ChunkDecoder<uint64_t>;
template class ChunkDecoder<float>;
template class ChunkDecoder<double>;

}  // namespace omfile
