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

#include "omfile/read/read_planner.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/format/variable.h"
#include "omfile/internal/log/verbose_flag.h"
#include "omfile/range.h"
#include "omfile/read/coalescing.h"
#include "omfile/read_options.h"
#include "omfile/util/iterate_over_index_range.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"
#include "omfile/util/str_cat.h"

namespace omfile {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag planner_logging(
    "omfile_read_planner");

}  // namespace

std::ostream& operator<<(std::ostream& os, const ChunkRead& x) {
  return os << "{chunk=" << x.chunk << ", grid_position=["
            << absl::StrJoin(x.grid_position, ",")
            << "], byte_range=" << x.byte_range << "}";
}

std::ostream& operator<<(std::ostream& os, const ReadBatch& x) {
  os << "{byte_range=" << x.byte_range << ", chunks=[";
  for (size_t i = 0; i < x.chunks.size(); ++i) {
    if (i != 0) os << ", ";
    os << x.chunks[i].chunk;
  }
  return os << "]}";
}

ReadPlanner::ReadPlanner(const Variable& variable, const ReadOptions& options)
    : chunks_(variable.chunks().begin(), variable.chunks().end()),
      grid_shape_(variable.chunk_grid_shape()),
      chunk_index_(variable.chunk_index()),
      options_(internal_read::CoalescingOptions::FromReadOptions(options)) {}

std::vector<ChunkRead> ReadPlanner::GetOverlappingChunks(
    absl::Span<const Range> ranges) const {
  const size_t rank = chunks_.size();
  std::vector<ChunkRead> result;
  std::vector<uint64_t> origin(rank), shape(rank);
  for (size_t i = 0; i < rank; ++i) {
    if (ranges[i].empty()) return result;
    // The grid walk is bounded by the array, since `ranges` are in bounds.
    origin[i] = ranges[i].start / chunks_[i];
    shape[i] = (ranges[i].end - 1) / chunks_[i] + 1 - origin[i];
  }
  IterateOverIndexRange(origin, shape, [&](absl::Span<const uint64_t> pos) {
    ChunkRead chunk_read;
    for (size_t i = 0; i < rank; ++i) {
      chunk_read.chunk = chunk_read.chunk * grid_shape_[i] + pos[i];
    }
    chunk_read.grid_position.assign(pos.begin(), pos.end());
    chunk_read.byte_range = chunk_index_.IndexSpan(chunk_read.chunk);
    result.push_back(std::move(chunk_read));
  });
  return result;
}

std::vector<ReadBatch> ReadPlanner::Coalesce(
    std::vector<ChunkRead> chunks) const {
  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const ChunkRead& a, const ChunkRead& b) {
                     if (a.byte_range.inclusive_min !=
                         b.byte_range.inclusive_min) {
                       return a.byte_range.inclusive_min <
                              b.byte_range.inclusive_min;
                     }
                     return a.chunk < b.chunk;
                   });
  std::vector<ReadBatch> batches;
  internal_read::ForEachCoalescedRange(
      absl::MakeSpan(chunks), options_,
      [](const ChunkRead& c) { return c.byte_range; },
      [&](ByteRange byte_range, absl::Span<ChunkRead> batch_chunks) {
        ReadBatch batch;
        batch.byte_range = byte_range;
        batch.chunks.assign(std::make_move_iterator(batch_chunks.begin()),
                            std::make_move_iterator(batch_chunks.end()));
        batches.push_back(std::move(batch));
      });
  return batches;
}

std::vector<IndexRead> ReadPlanner::PlanIndexReads(
    absl::Span<const Range> ranges) const {
  auto chunks = GetOverlappingChunks(ranges);
  const size_t num_chunks = chunks.size();
  auto index_reads = Coalesce(std::move(chunks));
  ABSL_LOG_IF(INFO, planner_logging)
      << "Planned " << index_reads.size() << " index reads for " << num_chunks
      << " chunks of request ["
      << absl::StrJoin(ranges, ",", absl::StreamFormatter()) << "]";
  return index_reads;
}

Result<std::vector<DataRead>> ReadPlanner::PlanDataReads(
    const IndexRead& index_read, const absl::Cord& index_bytes) const {
  if (index_bytes.size() != index_read.byte_range.size()) {
    return DecodeError(omfile::StrCat("Expected ", index_read.byte_range.size(),
                                      " bytes of chunk index at ",
                                      index_read.byte_range, ", but received ",
                                      index_bytes.size()));
  }
  const std::string flat(index_bytes);
  std::vector<ChunkRead> chunks;
  chunks.reserve(index_read.chunks.size());
  for (const ChunkRead& index_entry : index_read.chunks) {
    const ByteRange span = index_entry.byte_range;
    if (!index_read.byte_range.Contains(span)) {
      return DecodeError(omfile::StrCat("Index span ", span,
                                        " is outside of index read ",
                                        index_read.byte_range));
    }
    std::string_view entry_bytes = std::string_view(flat).substr(
        span.inclusive_min - index_read.byte_range.inclusive_min,
        span.size());
    ChunkRead data_entry;
    data_entry.chunk = index_entry.chunk;
    data_entry.grid_position = index_entry.grid_position;
    OMFILE_ASSIGN_OR_RETURN(
        data_entry.byte_range,
        chunk_index_.DecodeEntry(index_entry.chunk, entry_bytes));
    chunks.push_back(std::move(data_entry));
  }
  auto data_reads = Coalesce(std::move(chunks));
  ABSL_LOG_IF(INFO, planner_logging)
      << "Planned " << data_reads.size() << " data reads for index read "
      << index_read;
  return data_reads;
}

}  // namespace omfile
