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

#ifndef OMFILE_READ_READ_PLANNER_H_
#define OMFILE_READ_READ_PLANNER_H_

/// \file
/// Plans the backend reads needed to read a region of an array variable.
///
/// Reading happens in two phases, matching the two levels of the file: the
/// chunk index entries of all chunks overlapping the request are fetched
/// first (index reads), and the payloads they point at are fetched next
/// (data reads).  In both phases the byte spans are walked in ascending
/// offset order and merged into batches according to `ReadOptions`.

#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/format/chunk_index.h"
#include "omfile/format/variable.h"
#include "omfile/range.h"
#include "omfile/read/coalescing.h"
#include "omfile/read_options.h"
#include "omfile/util/result.h"

namespace omfile {

/// One chunk within a batch.
struct ChunkRead {
  /// Row-major number of the chunk in the chunk grid.
  uint64_t chunk = 0;

  /// Position of the chunk in the chunk grid.
  std::vector<uint64_t> grid_position;

  /// Bytes of this chunk within the batch: its index span for an index read,
  /// its payload for a data read.
  ByteRange byte_range;

  friend bool operator==(const ChunkRead& a, const ChunkRead& b) {
    return a.chunk == b.chunk && a.grid_position == b.grid_position &&
           a.byte_range == b.byte_range;
  }
  friend bool operator!=(const ChunkRead& a, const ChunkRead& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const ChunkRead& x);
};

/// One backend read and the chunks it serves.
struct ReadBatch {
  ByteRange byte_range;
  std::vector<ChunkRead> chunks;

  friend bool operator==(const ReadBatch& a, const ReadBatch& b) {
    return a.byte_range == b.byte_range && a.chunks == b.chunks;
  }
  friend bool operator!=(const ReadBatch& a, const ReadBatch& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const ReadBatch& x);
};

using IndexRead = ReadBatch;
using DataRead = ReadBatch;

class ReadPlanner {
 public:
  /// \pre `IsArray(variable.data_type())`
  ReadPlanner(const Variable& variable, const ReadOptions& options);

  /// Returns the chunks overlapping `ranges`, in row-major grid order, each
  /// with its index span.  Any empty range gives no chunks.
  ///
  /// \pre `ranges` has one in-bounds range per dimension.
  std::vector<ChunkRead> GetOverlappingChunks(
      absl::Span<const Range> ranges) const;

  /// Returns the index reads for `ranges`, in ascending offset order.
  ///
  /// \pre `ranges` has one in-bounds range per dimension.
  std::vector<IndexRead> PlanIndexReads(absl::Span<const Range> ranges) const;

  /// Decodes the payload locations of the chunks of `index_read` from
  /// `index_bytes`, the fetched bytes of `index_read.byte_range`, and returns
  /// the data reads in ascending offset order.
  ///
  /// \error `ErrorKind::kDecodeError` if `index_bytes` has the wrong size or
  ///     holds an invalid entry.
  Result<std::vector<DataRead>> PlanDataReads(
      const IndexRead& index_read, const absl::Cord& index_bytes) const;

 private:
  std::vector<ReadBatch> Coalesce(std::vector<ChunkRead> chunks) const;

  std::vector<uint64_t> chunks_;
  std::vector<uint64_t> grid_shape_;
  ChunkIndexLayout chunk_index_;
  internal_read::CoalescingOptions options_;
};

}  // namespace omfile

#endif  // OMFILE_READ_READ_PLANNER_H_
