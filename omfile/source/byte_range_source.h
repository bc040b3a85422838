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

#ifndef OMFILE_SOURCE_BYTE_RANGE_SOURCE_H_
#define OMFILE_SOURCE_BYTE_RANGE_SOURCE_H_

/// \file
/// Backend capability through which all file bytes are fetched.

#include <stdint.h>

#include <memory>

#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/util/result.h"

namespace omfile {

/// Random-access, read-only view of the bytes of one file.
///
/// Implementations may block.  They are shared by a reader and its children
/// through `std::shared_ptr`, and must tolerate calls from independent
/// readers on different threads.  Caching and retry policies belong to the
/// implementation.
class ByteRangeSource {
 public:
  virtual ~ByteRangeSource();

  /// Returns exactly `range.size()` bytes starting at `range.inclusive_min`,
  /// or an error.
  virtual Result<absl::Cord> Read(ByteRange range) = 0;

  /// Returns the total size of the file in bytes.
  virtual Result<uint64_t> Size() = 0;
};

using ByteRangeSourcePtr = std::shared_ptr<ByteRangeSource>;

/// Reads `range` from `source` and checks that the source returned the
/// requested number of bytes.
///
/// Errors from the source are returned unchanged.  A short or long read is
/// reported as `absl::StatusCode::kDataLoss`.
Result<absl::Cord> ReadExactly(ByteRangeSource& source, ByteRange range);

}  // namespace omfile

#endif  // OMFILE_SOURCE_BYTE_RANGE_SOURCE_H_
