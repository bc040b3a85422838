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

#ifndef OMFILE_SOURCE_MEMORY_BYTE_RANGE_SOURCE_H_
#define OMFILE_SOURCE_MEMORY_BYTE_RANGE_SOURCE_H_

#include <stdint.h>

#include <memory>
#include <utility>

#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"

namespace omfile {

/// `ByteRangeSource` over file contents held in memory.
class MemoryByteRangeSource : public ByteRangeSource {
 public:
  explicit MemoryByteRangeSource(absl::Cord data) : data_(std::move(data)) {}

  static std::shared_ptr<MemoryByteRangeSource> Make(absl::Cord data) {
    return std::make_shared<MemoryByteRangeSource>(std::move(data));
  }

  /// \error `absl::StatusCode::kOutOfRange` if `range` extends past the end
  ///     of the data.
  Result<absl::Cord> Read(ByteRange range) override;
  Result<uint64_t> Size() override { return data_.size(); }

  const absl::Cord& data() const { return data_; }

 private:
  absl::Cord data_;
};

}  // namespace omfile

#endif  // OMFILE_SOURCE_MEMORY_BYTE_RANGE_SOURCE_H_
