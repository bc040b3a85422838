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

#include "omfile/byte_range.h"

#include <limits>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/strings/cord.h"
#include "omfile/util/str_cat.h"

namespace {

using ::omfile::ByteRange;
using ::omfile::OffsetSize;
using ::omfile::StrCat;
using ::omfile::internal::GetSubCord;

TEST(ByteRangeTest, SatisfiesInvariants) {
  EXPECT_TRUE((ByteRange{0, 1}).SatisfiesInvariants());
  EXPECT_TRUE((ByteRange{0, 0}).SatisfiesInvariants());
  EXPECT_TRUE((ByteRange{10, 100}).SatisfiesInvariants());
  EXPECT_FALSE((ByteRange{100, 99}).SatisfiesInvariants());
}

TEST(ByteRangeTest, Size) {
  EXPECT_EQ(5, (ByteRange{2, 7}.size()));
  EXPECT_EQ(0, (ByteRange{2, 2}.size()));
}

TEST(ByteRangeTest, Contains) {
  ByteRange r{10, 20};
  EXPECT_TRUE(r.Contains(ByteRange{10, 20}));
  EXPECT_TRUE(r.Contains(ByteRange{12, 15}));
  EXPECT_FALSE(r.Contains(ByteRange{9, 15}));
  EXPECT_FALSE(r.Contains(ByteRange{15, 21}));
}

TEST(ByteRangeTest, Comparison) {
  ByteRange a{1, 2};
  ByteRange b{1, 3};
  EXPECT_TRUE(a == a);
  EXPECT_FALSE(a != a);
  EXPECT_NE(a, b);
}

TEST(ByteRangeTest, Ostream) {
  EXPECT_EQ("[1, 10)", StrCat(ByteRange{1, 10}));
}

TEST(OffsetSizeTest, ByteRange) {
  EXPECT_EQ((ByteRange{8, 20}), (OffsetSize{8, 12}.byte_range()));
}

TEST(OffsetSizeTest, Overflows) {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_FALSE((OffsetSize{kMax, 0}).Overflows());
  EXPECT_FALSE((OffsetSize{kMax - 1, 1}).Overflows());
  EXPECT_TRUE((OffsetSize{kMax, 1}).Overflows());
}

TEST(OffsetSizeTest, Ostream) {
  EXPECT_EQ("{offset=3, size=4}", StrCat(OffsetSize{3, 4}));
}

TEST(GetSubCordTest, Basic) {
  absl::Cord cord("abcdef");
  EXPECT_EQ("abcdef", GetSubCord(cord, 100, ByteRange{100, 106}));
  EXPECT_EQ("cd", GetSubCord(cord, 100, ByteRange{102, 104}));
  EXPECT_EQ("", GetSubCord(cord, 100, ByteRange{106, 106}));
}

}  // namespace
