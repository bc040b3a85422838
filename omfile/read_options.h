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

#ifndef OMFILE_READ_OPTIONS_H_
#define OMFILE_READ_OPTIONS_H_

#include <stdint.h>

#include <iosfwd>

#include "absl/status/status.h"

namespace omfile {

/// Tunables of the read planner.
struct ReadOptions {
  static constexpr uint64_t kDefaultIoSizeMax = 65536;
  static constexpr uint64_t kDefaultIoSizeMerge = 512;

  /// Largest single backend read, in bytes.  A single span larger than this
  /// is still read, as its own batch.
  uint64_t io_size_max = kDefaultIoSizeMax;

  /// Largest gap, in bytes, between two spans that are still fetched with
  /// one backend read.
  uint64_t io_size_merge = kDefaultIoSizeMerge;

  /// Returns the built-in defaults, overridden by the
  /// `--omfile_io_size_max`/`--omfile_io_size_merge` flags or, when a flag
  /// is unset, by the `OMFILE_IO_SIZE_MAX`/`OMFILE_IO_SIZE_MERGE`
  /// environment variables.
  static ReadOptions Default();

  /// \error `absl::StatusCode::kInvalidArgument` if `io_size_max == 0`.
  absl::Status Validate() const;

  friend bool operator==(const ReadOptions& a, const ReadOptions& b) {
    return a.io_size_max == b.io_size_max && a.io_size_merge == b.io_size_merge;
  }
  friend bool operator!=(const ReadOptions& a, const ReadOptions& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const ReadOptions& x);
};

}  // namespace omfile

#endif  // OMFILE_READ_OPTIONS_H_
