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

#ifndef OMFILE_SOURCE_FILE_BYTE_RANGE_SOURCE_H_
#define OMFILE_SOURCE_FILE_BYTE_RANGE_SOURCE_H_

#include <stdint.h>

#include <memory>
#include <string>
#include <utility>

#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/internal/os/file_descriptor.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"

namespace omfile {

/// `ByteRangeSource` reading a local file with positional reads.
///
/// The file descriptor is owned by the source and closed on destruction.
/// Reads do not move a shared file position, so the source may be used from
/// several readers concurrently.
class FileByteRangeSource : public ByteRangeSource {
 public:
  /// Opens `path` for reading.
  static Result<std::shared_ptr<FileByteRangeSource>> Open(
      const std::string& path);

  explicit FileByteRangeSource(internal_os::UniqueFileDescriptor fd,
                               std::string path)
      : fd_(std::move(fd)), path_(std::move(path)) {}

  /// \error `absl::StatusCode::kOutOfRange` if the file ends before
  ///     `range.exclusive_max`.
  Result<absl::Cord> Read(ByteRange range) override;
  Result<uint64_t> Size() override;

  const std::string& path() const { return path_; }

 private:
  internal_os::UniqueFileDescriptor fd_;
  std::string path_;
};

}  // namespace omfile

#endif  // OMFILE_SOURCE_FILE_BYTE_RANGE_SOURCE_H_
