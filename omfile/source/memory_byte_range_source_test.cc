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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/status_testutil.h"

namespace {

using ::omfile::ByteRange;
using ::omfile::IsOkAndHolds;
using ::omfile::MatchesStatus;
using ::omfile::MemoryByteRangeSource;

TEST(MemoryByteRangeSourceTest, Read) {
  auto source = MemoryByteRangeSource::Make(absl::Cord("0123456789"));
  EXPECT_THAT(source->Size(), IsOkAndHolds(10));
  EXPECT_THAT(source->Read(ByteRange{2, 5}), IsOkAndHolds(absl::Cord("234")));
  EXPECT_THAT(source->Read(ByteRange{0, 10}),
              IsOkAndHolds(absl::Cord("0123456789")));
  EXPECT_THAT(source->Read(ByteRange{10, 10}), IsOkAndHolds(absl::Cord()));
}

TEST(MemoryByteRangeSourceTest, ReadPastEnd) {
  auto source = MemoryByteRangeSource::Make(absl::Cord("0123456789"));
  EXPECT_THAT(source->Read(ByteRange{8, 11}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(source->Read(ByteRange{5, 4}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST(ReadExactlyTest, Basic) {
  MemoryByteRangeSource source(absl::Cord("abcdef"));
  EXPECT_THAT(omfile::ReadExactly(source, ByteRange{1, 3}),
              IsOkAndHolds(absl::Cord("bc")));
  EXPECT_THAT(omfile::ReadExactly(source, ByteRange{4, 8}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

// A source that returns fewer bytes than requested.
class ShortSource : public omfile::ByteRangeSource {
 public:
  omfile::Result<absl::Cord> Read(ByteRange range) override {
    return absl::Cord("x");
  }
  omfile::Result<uint64_t> Size() override { return 100; }
};

TEST(ReadExactlyTest, ShortRead) {
  ShortSource source;
  EXPECT_THAT(omfile::ReadExactly(source, ByteRange{0, 4}),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Read of \\[0, 4\\) returned 1 bytes"));
}

}  // namespace
