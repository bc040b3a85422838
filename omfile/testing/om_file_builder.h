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

#ifndef OMFILE_TESTING_OM_FILE_BUILDER_H_
#define OMFILE_TESTING_OM_FILE_BUILDER_H_

/// \file
/// Writes small OM files for tests.

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <string_view>
#include <vector>

#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"

namespace omfile {
namespace internal_testing {

// Little-endian byte helper functions
void PutLE16(std::string& dst, uint16_t v);
void PutLE32(std::string& dst, uint32_t v);
void PutLE64(std::string& dst, uint64_t v);
void PutF32(std::string& dst, float v);
void PutF64(std::string& dst, double v);

/// Encodes the elements of one chunk, given in row-major order, whose
/// extent along the last dimension is `cols`.
template <typename T>
std::string EncodeChunk(CompressionType compression, double scale_factor,
                        double add_offset, absl::Span<const T> values,
                        size_t cols);

/// Description of an array variable.
struct ArraySpec {
  std::string name;
  CompressionType compression = CompressionType::kPforDelta2d;
  double scale_factor = 1;
  double add_offset = 0;
  std::vector<uint64_t> dimensions;
  std::vector<uint64_t> chunks;
  std::vector<OffsetSize> children;
};

/// All parts of a metadata record.
struct RecordSpec {
  DataType data_type = DataType::kNone;
  CompressionType compression = CompressionType::kNone;
  double scale_factor = 1;
  double add_offset = 0;
  std::vector<uint64_t> dimensions;
  std::vector<uint64_t> chunks;
  uint64_t index_offset = 0;
  std::vector<OffsetSize> children;
  std::string name;
  std::string payload;
};

/// Encodes a metadata record.
std::string EncodeRecord(const RecordSpec& spec);

/// Encodes a trailer pointing at `root`.
std::string EncodeTrailer(OffsetSize root);

// Helper class for building trailer-addressed test files.  Variables are
// appended bottom-up: children first, so that their locations can be passed
// to the parent.
class OmFileBuilder {
 public:
  OmFileBuilder();

  /// Appends the chunks, chunk index and metadata record of an array
  /// variable and returns the location of the record.
  ///
  /// `values` holds all elements in row-major order.
  template <typename T>
  OffsetSize AddArray(const ArraySpec& spec, absl::Span<const T> values);

  /// Appends the record of a scalar variable.
  template <typename T>
  OffsetSize AddScalar(std::string_view name, const T& value,
                       std::vector<OffsetSize> children = {});

  /// Appends the record of a group variable, which has type `kNone` and
  /// holds only children.
  OffsetSize AddGroup(std::string_view name, std::vector<OffsetSize> children);

  /// Appends `spec` encoded as a record.
  OffsetSize AddRecord(const RecordSpec& spec);

  /// Appends raw bytes.
  OffsetSize AddRaw(std::string_view bytes);

  /// Returns the file with a trailer pointing at `root`.
  std::string Build(OffsetSize root) const;

  size_t CurrentOffset() const { return data_.size(); }

  std::string data_;
};

/// Returns a legacy file holding a 2D float array.
///
/// For `version == 1` the compression byte is written as zero and readers
/// assume `kPforDelta2dInt16`.
std::string MakeLegacyFile(uint8_t version, CompressionType compression,
                           float scale_factor,
                           absl::Span<const uint64_t> dimensions,
                           absl::Span<const uint64_t> chunks,
                           absl::Span<const float> values);

/// Returns a file whose root is an `int32` array of dimensions `[5, 5]`,
/// chunks `[2, 2]` and values `0..24`, compressed with `kPforDelta2d`.
std::string MakeGridFile();

/// Returns a file with a tree of variables:
///
///     root (group)
///       temperature: float [4, 6], chunks [2, 3], kFpxXor2d
///         units: string "K"
///       (unnamed group)
///         count: int64 42
///       height: double [3], chunks [2], kNone
std::string MakeTreeFile();

}  // namespace internal_testing
}  // namespace omfile

#endif  // OMFILE_TESTING_OM_FILE_BUILDER_H_
