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

#include "omfile/source/byte_range_source.h"

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/util/result.h"
#include "omfile/util/str_cat.h"

namespace omfile {

ByteRangeSource::~ByteRangeSource() = default;

Result<absl::Cord> ReadExactly(ByteRangeSource& source, ByteRange range) {
  OMFILE_ASSIGN_OR_RETURN(auto value, source.Read(range));
  if (value.size() != range.size()) {
    return absl::DataLossError(
        omfile::StrCat("Read of ", range, " returned ", value.size(),
                       " bytes"));
  }
  return value;
}

}  // namespace omfile
