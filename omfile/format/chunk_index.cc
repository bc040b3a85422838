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

#include "omfile/format/chunk_index.h"

#include <stdint.h>

#include <cassert>
#include <limits>
#include <string_view>

#include "absl/base/internal/endian.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/util/result.h"
#include "omfile/util/str_cat.h"

namespace omfile {
namespace {

constexpr uint64_t kMaxOffset = std::numeric_limits<uint64_t>::max();

size_t EntrySize(ChunkIndexLayout::Encoding encoding) {
  return encoding == ChunkIndexLayout::Encoding::kOffsetLength
             ? ChunkIndexLayout::kOffsetLengthEntrySize
             : ChunkIndexLayout::kLegacyEntrySize;
}

}  // namespace

Result<ChunkIndexLayout> ChunkIndexLayout::Make(Encoding encoding,
                                                uint64_t table_offset,
                                                uint64_t num_chunks) {
  const uint64_t entry_size = EntrySize(encoding);
  if (num_chunks > (kMaxOffset - table_offset) / entry_size) {
    return DecodeError(omfile::StrCat("Chunk index of ", num_chunks,
                                      " entries at offset ", table_offset,
                                      " overflows"));
  }
  ChunkIndexLayout layout;
  layout.encoding_ = encoding;
  layout.table_offset_ = table_offset;
  layout.num_chunks_ = num_chunks;
  return layout;
}

ByteRange ChunkIndexLayout::table_byte_range() const {
  return {table_offset_, table_offset_ + num_chunks_ * EntrySize(encoding_)};
}

ByteRange ChunkIndexLayout::IndexSpan(uint64_t chunk) const {
  assert(chunk < num_chunks_);
  if (encoding_ == Encoding::kOffsetLength) {
    const uint64_t start = table_offset_ + chunk * kOffsetLengthEntrySize;
    return {start, start + kOffsetLengthEntrySize};
  }
  const uint64_t end = table_offset_ + (chunk + 1) * kLegacyEntrySize;
  return {chunk == 0 ? table_offset_ : end - 2 * kLegacyEntrySize, end};
}

Result<ByteRange> ChunkIndexLayout::DecodeEntry(uint64_t chunk,
                                                std::string_view span) const {
  const uint64_t expected_size = IndexSpan(chunk).size();
  if (span.size() != expected_size) {
    return DecodeError(omfile::StrCat("Expected ", expected_size,
                                      " index bytes for chunk ", chunk,
                                      ", but received ", span.size()));
  }
  ByteRange r;
  if (encoding_ == Encoding::kOffsetLength) {
    OffsetSize entry{absl::little_endian::Load64(span.data()),
                     absl::little_endian::Load64(span.data() + 8)};
    if (entry.Overflows()) {
      return DecodeError(omfile::StrCat("Chunk index entry ", entry,
                                        " for chunk ", chunk, " overflows"));
    }
    r = entry.byte_range();
  } else {
    // The data section starts directly after the table.
    const uint64_t data_start = table_byte_range().exclusive_max;
    uint64_t start = 0;
    uint64_t end;
    if (chunk == 0) {
      end = absl::little_endian::Load64(span.data());
    } else {
      start = absl::little_endian::Load64(span.data());
      end = absl::little_endian::Load64(span.data() + 8);
    }
    if (end < start || end > kMaxOffset - data_start) {
      return DecodeError(omfile::StrCat("Chunk index for chunk ", chunk,
                                        " specifies invalid payload [", start,
                                        ", ", end, ")"));
    }
    r = ByteRange{data_start + start, data_start + end};
  }
  return r;
}

}  // namespace omfile
