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

#ifndef OMFILE_READ_COALESCING_H_
#define OMFILE_READ_COALESCING_H_

#include <stddef.h>
#include <stdint.h>

#include <algorithm>

#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/read_options.h"

namespace omfile {
namespace internal_read {

struct CoalescingOptions {
  // Maximum gap between the end of the current batch and the start of the
  // next span for the span to join the batch.
  uint64_t max_gap = ReadOptions::kDefaultIoSizeMerge;

  // Maximum size of a batch.  A single span larger than this still forms a
  // batch of its own.
  uint64_t max_size = ReadOptions::kDefaultIoSizeMax;

  static CoalescingOptions FromReadOptions(const ReadOptions& options) {
    return {options.io_size_merge, options.io_size_max};
  }

  // Checks if `next` should join `batch`.  Overlapping spans are subject to
  // the same size limit as disjoint ones.
  bool operator()(ByteRange batch, ByteRange next) const {
    if (next.inclusive_min > batch.exclusive_max &&
        next.inclusive_min - batch.exclusive_max > max_gap) {
      return false;
    }
    return next.size() <= max_size && batch.size() <= max_size - next.size();
  }
};

// Groups consecutive `entries` into coalesced byte ranges.
//
// `entries` must already be ordered by the start of their byte range.
//
// \param get_byte_range Callable with signature
//     `ByteRange (const Entry&)`.
// \param callback Callable with signature
//     `void (ByteRange coalesced_byte_range, absl::Span<Entry> entries)`
//     invoked once per batch, in order.
template <typename Entry, typename GetByteRange, typename Callback>
void ForEachCoalescedRange(absl::Span<Entry> entries,
                           const CoalescingOptions& options,
                           GetByteRange get_byte_range, Callback callback) {
  size_t i = 0;
  while (i < entries.size()) {
    ByteRange coalesced = get_byte_range(entries[i]);
    size_t end_i;
    for (end_i = i + 1; end_i < entries.size(); ++end_i) {
      const ByteRange next = get_byte_range(entries[end_i]);
      if (!options(coalesced, next)) break;
      coalesced.exclusive_max =
          std::max(coalesced.exclusive_max, next.exclusive_max);
    }
    callback(coalesced, entries.subspan(i, end_i - i));
    i = end_i;
  }
}

}  // namespace internal_read
}  // namespace omfile

#endif  // OMFILE_READ_COALESCING_H_
