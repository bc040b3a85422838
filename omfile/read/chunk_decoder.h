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

#ifndef OMFILE_READ_CHUNK_DECODER_H_
#define OMFILE_READ_CHUNK_DECODER_H_

/// \file
/// Decodes chunk payloads into the output buffer of a read.
///
/// Every codec except `CompressionType::kNone` stores a zlib stream of the
/// chunk's elements after a 2D transform.  The 2D view of a chunk has
/// `cols` equal to its extent along the last dimension and `rows` equal to
/// the number of elements divided by `cols`, using the extents of the chunk
/// clipped at the array edge.  Row `r > 0` is stored relative to row
/// `r - 1`:
///
/// - `kPforDelta2dInt16`: `int16` values, as differences.  Decoded values
///   are `x / scale_factor - add_offset`; `INT16_MAX` marks a missing value
///   and decodes to NaN.
/// - `kPforDelta2dInt16Logarithmic`: as above, followed by `10^x - 1`.
/// - `kFpxXor2d`: float or double bit patterns, XORed.
/// - `kPforDelta2d`: integers of the element width, as wrapping
///   differences.
/// - `kNone`: raw elements without transform or zlib.
///
/// The entropy stage is zlib.  Chunks whose transformed values were packed
/// with PFor/TurboPFor bit-packing, as other OM file writers produce them,
/// are not readable and fail with `ErrorKind::kDecodeError`.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"
#include "omfile/format/variable.h"
#include "omfile/range.h"

namespace omfile {

/// Decodes the chunks of one read request into `output`.
///
/// \tparam T Numeric element type of the variable.
template <typename T>
class ChunkDecoder {
 public:
  /// \pre `ranges` has one in-bounds range per dimension of `variable`.
  /// \pre `output.size()` is at least the number of requested elements.
  ChunkDecoder(const Variable& variable, absl::Span<const Range> ranges,
               absl::Span<T> output);

  /// Decodes the chunk at `grid_position` from `payload` and writes the
  /// elements that lie within the requested region to the output.
  ///
  /// \error `ErrorKind::kDecodeError` if the payload is corrupt, decodes to
  ///     the wrong number of elements, or the compression does not support
  ///     the element type.
  absl::Status DecodeChunk(absl::Span<const uint64_t> grid_position,
                           const absl::Cord& payload) const;

 private:
  absl::Status DecodeValues(const absl::Cord& payload, size_t rows,
                            size_t cols, absl::Span<T> values) const;

  void Place(absl::Span<const uint64_t> chunk_origin,
             absl::Span<const uint64_t> chunk_shape,
             absl::Span<const T> values) const;

  DataType element_type_;
  CompressionType compression_;
  double scale_factor_;
  double add_offset_;
  std::vector<uint64_t> dimensions_;
  std::vector<uint64_t> chunks_;
  std::vector<Range> ranges_;
  std::vector<uint64_t> output_strides_;
  absl::Span<T> output_;
};

}  // namespace omfile

#endif  // OMFILE_READ_CHUNK_DECODER_H_
