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

#ifndef OMFILE_RANGE_H_
#define OMFILE_RANGE_H_

#include <stdint.h>

#include <ostream>

namespace omfile {

/// Half-open interval `[start, end)` of indices along one array dimension.
struct Range {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t size() const { return end > start ? end - start : 0; }
  bool empty() const { return end <= start; }

  friend bool operator==(const Range& a, const Range& b) {
    return a.start == b.start && a.end == b.end;
  }
  friend bool operator!=(const Range& a, const Range& b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, const Range& r) {
    return os << "[" << r.start << ", " << r.end << ")";
  }
};

}  // namespace omfile

#endif  // OMFILE_RANGE_H_
