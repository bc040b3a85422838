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

#include "omfile/source/memory_byte_range_source.h"

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/util/result.h"
#include "omfile/util/str_cat.h"

namespace omfile {

Result<absl::Cord> MemoryByteRangeSource::Read(ByteRange range) {
  if (!range.SatisfiesInvariants() || range.exclusive_max > data_.size()) {
    return absl::OutOfRangeError(omfile::StrCat(
        "Requested byte range ", range, " is not valid for value of size ",
        data_.size()));
  }
  return internal::GetSubCord(data_, 0, range);
}

}  // namespace omfile
