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

#ifndef OMFILE_FORMAT_CHUNK_INDEX_H_
#define OMFILE_FORMAT_CHUNK_INDEX_H_

/// \file
/// Location of chunk payloads.
///
/// Each array variable has a chunk index table with one entry per chunk, in
/// row-major order over the chunk grid.  Two encodings exist:
///
/// - `kOffsetLength` (trailer-addressed files): 16-byte entries
///   `(u64 offset, u64 length)` holding the absolute payload location.
///
/// - `kLegacyEndOffsets` (legacy files): 8-byte entries holding the end of
///   each payload relative to the data section, which directly follows the
///   table.  The payload of chunk `i` starts where chunk `i - 1` ends, so
///   its index span covers entries `i - 1` and `i`.

#include <stddef.h>
#include <stdint.h>

#include <string_view>

#include "omfile/byte_range.h"
#include "omfile/util/result.h"

namespace omfile {

class ChunkIndexLayout {
 public:
  enum class Encoding {
    kOffsetLength,
    kLegacyEndOffsets,
  };

  static constexpr size_t kOffsetLengthEntrySize = 16;
  static constexpr size_t kLegacyEntrySize = 8;

  ChunkIndexLayout() = default;

  /// Returns the layout of a table of `num_chunks` entries starting at file
  /// offset `table_offset`.
  ///
  /// \error `ErrorKind::kDecodeError` if the table extends past the largest
  ///     representable offset.
  static Result<ChunkIndexLayout> Make(Encoding encoding,
                                       uint64_t table_offset,
                                       uint64_t num_chunks);

  Encoding encoding() const { return encoding_; }
  uint64_t num_chunks() const { return num_chunks_; }

  /// Byte range of the whole table.
  ByteRange table_byte_range() const;

  /// Returns the index bytes that must be fetched to locate the payload of
  /// `chunk`.
  ///
  /// \pre `chunk < num_chunks()`
  ByteRange IndexSpan(uint64_t chunk) const;

  /// Decodes the payload location of `chunk` from `span`, the bytes of
  /// `IndexSpan(chunk)`.
  ///
  /// \error `ErrorKind::kDecodeError` if `span` has the wrong size or the
  ///     entry describes an inverted or overflowing byte range.
  Result<ByteRange> DecodeEntry(uint64_t chunk, std::string_view span) const;

 private:
  Encoding encoding_ = Encoding::kOffsetLength;
  uint64_t table_offset_ = 0;
  uint64_t num_chunks_ = 0;
};

}  // namespace omfile

#endif  // OMFILE_FORMAT_CHUNK_INDEX_H_
