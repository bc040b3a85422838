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

#include "omfile/source/file_byte_range_source.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/cord_buffer.h"
#include "omfile/byte_range.h"
#include "omfile/internal/log/verbose_flag.h"
#include "omfile/internal/os/file_descriptor.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"
#include "omfile/util/str_cat.h"

namespace omfile {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag file_logging("omfile_file_source");

}  // namespace

Result<std::shared_ptr<FileByteRangeSource>> FileByteRangeSource::Open(
    const std::string& path) {
  OMFILE_ASSIGN_OR_RETURN(auto fd,
                          internal_os::OpenExistingFileForReading(path));
  return std::make_shared<FileByteRangeSource>(std::move(fd), path);
}

Result<absl::Cord> FileByteRangeSource::Read(ByteRange range) {
  ABSL_LOG_IF(INFO, file_logging) << "Read " << path_ << " " << range;
  absl::Cord result;
  uint64_t offset = range.inclusive_min;
  while (offset < range.exclusive_max) {
    const size_t remaining =
        static_cast<size_t>(range.exclusive_max - offset);
    auto buffer = absl::CordBuffer::CreateWithDefaultLimit(remaining);
    buffer.SetLength(std::min(remaining, buffer.capacity()));
    OMFILE_ASSIGN_OR_RETURN(
        ptrdiff_t n,
        internal_os::ReadFromFile(fd_.get(), buffer.data(), buffer.length(),
                                  static_cast<int64_t>(offset)),
        MaybeAnnotateStatus(_, omfile::StrCat("Reading ", path_)));
    if (n == 0) {
      return absl::OutOfRangeError(omfile::StrCat(
          "Requested byte range ", range, " extends past the end of ", path_,
          " at ", offset));
    }
    buffer.SetLength(static_cast<size_t>(n));
    result.Append(std::move(buffer));
    offset += static_cast<uint64_t>(n);
  }
  return result;
}

Result<uint64_t> FileByteRangeSource::Size() {
  return internal_os::GetFileSize(fd_.get());
}

}  // namespace omfile
