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

#ifndef OMFILE_BYTE_RANGE_H_
#define OMFILE_BYTE_RANGE_H_

#include <stddef.h>
#include <stdint.h>

#include <cassert>
#include <limits>
#include <ostream>

#include "absl/strings/cord.h"

namespace omfile {

/// Specifies a range of bytes within the file.
struct ByteRange {
  /// Specifies the starting byte (inclusive).
  uint64_t inclusive_min = 0;

  /// Specifies the ending byte (exclusive).
  uint64_t exclusive_max = 0;

  /// Checks that this byte range is valid.
  constexpr bool SatisfiesInvariants() const {
    return exclusive_max >= inclusive_min;
  }

  /// Returns the number of bytes contained in the range.
  ///
  /// \dchecks `SatisfiesInvariants()`
  uint64_t size() const {
    assert(SatisfiesInvariants());
    return exclusive_max - inclusive_min;
  }

  /// Returns `true` if `other` lies entirely within this range.
  bool Contains(const ByteRange& other) const {
    return other.inclusive_min >= inclusive_min &&
           other.exclusive_max <= exclusive_max;
  }

  friend bool operator==(const ByteRange& a, const ByteRange& b) {
    return a.inclusive_min == b.inclusive_min &&
           a.exclusive_max == b.exclusive_max;
  }
  friend bool operator!=(const ByteRange& a, const ByteRange& b) {
    return !(a == b);
  }

  /// Prints a debugging string representation to an `std::ostream`.
  friend std::ostream& operator<<(std::ostream& os, const ByteRange& r);
};

/// Location of a record in the file, as stored on disk: an absolute offset
/// and a length.
struct OffsetSize {
  uint64_t offset = 0;
  uint64_t size = 0;

  /// Returns `true` if `offset + size` does not fit in 64 bits.
  bool Overflows() const {
    return size > std::numeric_limits<uint64_t>::max() - offset;
  }

  /// \pre `!Overflows()`
  ByteRange byte_range() const {
    assert(!Overflows());
    return {offset, offset + size};
  }

  friend bool operator==(const OffsetSize& a, const OffsetSize& b) {
    return a.offset == b.offset && a.size == b.size;
  }
  friend bool operator!=(const OffsetSize& a, const OffsetSize& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const OffsetSize& x);
};

namespace internal {

/// Returns the bytes of `range` from `s`, whose first byte is at file offset
/// `base`.
///
/// \pre `ByteRange{base, base + s.size()}.Contains(range)`
inline absl::Cord GetSubCord(const absl::Cord& s, uint64_t base,
                             ByteRange range) {
  assert(range.SatisfiesInvariants());
  assert(range.inclusive_min >= base);
  assert(range.exclusive_max - base <= s.size());
  const size_t start = static_cast<size_t>(range.inclusive_min - base);
  const size_t size = static_cast<size_t>(range.size());
  if (start == 0 && size == s.size()) return s;
  return s.Subcord(start, size);
}

}  // namespace internal
}  // namespace omfile

#endif  // OMFILE_BYTE_RANGE_H_
