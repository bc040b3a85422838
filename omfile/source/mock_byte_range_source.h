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

#ifndef OMFILE_SOURCE_MOCK_BYTE_RANGE_SOURCE_H_
#define OMFILE_SOURCE_MOCK_BYTE_RANGE_SOURCE_H_

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/synchronization/mutex.h"
#include "omfile/byte_range.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"

namespace omfile {
namespace internal {

/// `ByteRangeSource` that records every request and forwards it to a target
/// source.
///
/// This is used to test the fetch pattern produced by the reader and to
/// inject errors to test error handling.
class MockByteRangeSource : public ByteRangeSource {
 public:
  /// Returns an error to fail a read with, or `absl::OkStatus()` to forward
  /// it.
  using ReadHook = std::function<absl::Status(ByteRange)>;

  explicit MockByteRangeSource(ByteRangeSourcePtr target)
      : target_(std::move(target)) {}

  static std::shared_ptr<MockByteRangeSource> Make(ByteRangeSourcePtr target) {
    return std::make_shared<MockByteRangeSource>(std::move(target));
  }

  Result<absl::Cord> Read(ByteRange range) override;
  Result<uint64_t> Size() override;

  /// Installs a hook consulted before each read is forwarded.
  void SetReadHook(ReadHook hook);

  /// Fails the `n`-th read issued after this call (counting from 0) with
  /// `status`.
  void FailReadAt(size_t n, absl::Status status);

  /// Returns the reads issued so far, in order.
  std::vector<ByteRange> read_requests() const;

  size_t read_count() const;
  size_t size_count() const;

  /// Forgets recorded requests.
  void ClearRequests();

 private:
  ByteRangeSourcePtr target_;
  mutable absl::Mutex mutex_;
  ReadHook hook_ ABSL_GUARDED_BY(mutex_);
  std::vector<ByteRange> read_requests_ ABSL_GUARDED_BY(mutex_);
  size_t size_count_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace internal
}  // namespace omfile

#endif  // OMFILE_SOURCE_MOCK_BYTE_RANGE_SOURCE_H_
