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

#ifndef OMFILE_FORMAT_COMPRESSION_H_
#define OMFILE_FORMAT_COMPRESSION_H_

#include <stdint.h>

#include <iosfwd>
#include <string_view>

#include "omfile/format/data_type.h"

namespace omfile {

/// Chunk codec, as stored in the metadata record.
enum class CompressionType : uint8_t {
  /// Lossy: values scaled to `int16`, 2D delta coded.
  kPforDelta2dInt16 = 0,
  /// Lossless: 2D XOR of float/double bit patterns.
  kFpxXor2d = 1,
  /// Lossless: 2D delta coded integers, no scaling.
  kPforDelta2d = 2,
  /// As `kPforDelta2dInt16`, applied to `log10(1 + x)`.
  kPforDelta2dInt16Logarithmic = 3,
  /// Raw little-endian elements.
  kNone = 4,
};

constexpr uint8_t kMaxCompressionTypeTag = 4;

constexpr bool IsValidCompressionTypeTag(uint8_t tag) {
  return tag <= kMaxCompressionTypeTag;
}

/// Returns `true` if chunks of element type `element` (a scalar tag) can be
/// stored with `compression`.
bool IsSupportedCombination(CompressionType compression, DataType element);

std::string_view CompressionTypeName(CompressionType c);

std::ostream& operator<<(std::ostream& os, CompressionType c);

}  // namespace omfile

#endif  // OMFILE_FORMAT_COMPRESSION_H_
