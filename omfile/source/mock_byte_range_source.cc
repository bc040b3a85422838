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

#include "omfile/source/mock_byte_range_source.h"

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/synchronization/mutex.h"
#include "omfile/byte_range.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"

namespace omfile {
namespace internal {

Result<absl::Cord> MockByteRangeSource::Read(ByteRange range) {
  ReadHook hook;
  {
    absl::MutexLock lock(&mutex_);
    read_requests_.push_back(range);
    hook = hook_;
  }
  if (hook) {
    OMFILE_RETURN_IF_ERROR(hook(range));
  }
  return target_->Read(range);
}

Result<uint64_t> MockByteRangeSource::Size() {
  {
    absl::MutexLock lock(&mutex_);
    ++size_count_;
  }
  return target_->Size();
}

void MockByteRangeSource::SetReadHook(ReadHook hook) {
  absl::MutexLock lock(&mutex_);
  hook_ = std::move(hook);
}

void MockByteRangeSource::FailReadAt(size_t n, absl::Status status) {
  auto count = std::make_shared<size_t>(0);
  SetReadHook([n, count, status = std::move(status)](ByteRange) {
    return (*count)++ == n ? status : absl::OkStatus();
  });
}

std::vector<ByteRange> MockByteRangeSource::read_requests() const {
  absl::MutexLock lock(&mutex_);
  return read_requests_;
}

size_t MockByteRangeSource::read_count() const {
  absl::MutexLock lock(&mutex_);
  return read_requests_.size();
}

size_t MockByteRangeSource::size_count() const {
  absl::MutexLock lock(&mutex_);
  return size_count_;
}

void MockByteRangeSource::ClearRequests() {
  absl::MutexLock lock(&mutex_);
  read_requests_.clear();
  size_count_ = 0;
}

}  // namespace internal
}  // namespace omfile
