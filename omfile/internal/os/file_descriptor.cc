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

#include "omfile/internal/os/file_descriptor.h"

#include <errno.h>
#include <fcntl.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "omfile/internal/log/verbose_flag.h"
#include "omfile/internal/os/error_code.h"
#include "omfile/util/result.h"

namespace omfile {
namespace internal_os {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag file_logging("omfile_file_source");

}  // namespace

void FileDescriptorTraits::Close(FileDescriptor fd) {
  while (::close(fd) != 0) {
    if (errno == EINTR) continue;
    ABSL_LOG_IF(INFO, file_logging)
        << "close(" << fd << ") failed: " << GetOsErrorMessage(errno);
    return;
  }
}

Result<UniqueFileDescriptor> OpenExistingFileForReading(
    const std::string& path) {
  FileDescriptor fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == FileDescriptorTraits::Invalid()) {
    return StatusFromOsError(errno, "Failed to open: \"", path, "\"");
  }
  ABSL_LOG_IF(INFO, file_logging) << "Opened " << path << " as fd " << fd;
  return UniqueFileDescriptor(fd);
}

Result<ptrdiff_t> ReadFromFile(FileDescriptor fd, void* buf, size_t count,
                               int64_t offset) {
  ssize_t n;
  do {
    n = ::pread(fd, buf, count, static_cast<off_t>(offset));
  } while ((n < 0) && (errno == EINTR || errno == EAGAIN));
  ABSL_LOG_IF(INFO, file_logging.Level(1))
      << "pread(fd=" << fd << ", count=" << count << ", offset=" << offset
      << ") = " << n;
  if (n >= 0) {
    return n;
  }
  return StatusFromOsError(errno, "Failed to read from file");
}

Result<uint64_t> GetFileSize(FileDescriptor fd) {
  struct ::stat info;
  if (::fstat(fd, &info) != 0) {
    return StatusFromOsError(errno, "Failed to get file info");
  }
  return static_cast<uint64_t>(info.st_size);
}

}  // namespace internal_os
}  // namespace omfile
