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

#ifndef OMFILE_INTERNAL_OS_FILE_DESCRIPTOR_H_
#define OMFILE_INTERNAL_OS_FILE_DESCRIPTOR_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "omfile/internal/unique_handle.h"
#include "omfile/util/result.h"

namespace omfile {
namespace internal_os {

using FileDescriptor = int;

/// File descriptor traits for use with `UniqueHandle`.
struct FileDescriptorTraits {
  static FileDescriptor Invalid() { return -1; }
  static void Close(FileDescriptor fd);
};

/// Unique handle to an open file descriptor, closed by the destructor.
using UniqueFileDescriptor =
    internal::UniqueHandle<FileDescriptor, FileDescriptorTraits>;

/// Opens an existing file for reading.
Result<UniqueFileDescriptor> OpenExistingFileForReading(
    const std::string& path);

/// Reads up to `count` bytes at `offset` into `buf`, retrying on
/// `EINTR`/`EAGAIN`.  Returns the number of bytes read; `0` at end of
/// file.
Result<ptrdiff_t> ReadFromFile(FileDescriptor fd, void* buf, size_t count,
                               int64_t offset);

/// Returns the size in bytes of the open file.
Result<uint64_t> GetFileSize(FileDescriptor fd);

}  // namespace internal_os
}  // namespace omfile

#endif  // OMFILE_INTERNAL_OS_FILE_DESCRIPTOR_H_
