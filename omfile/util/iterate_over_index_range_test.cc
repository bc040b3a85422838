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

#include "omfile/util/iterate_over_index_range.h"

#include <stdint.h>

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/types/span.h"

namespace {

using ::omfile::IterateOverIndexRange;
using ::testing::ElementsAre;

std::vector<std::vector<uint64_t>> Collect(std::vector<uint64_t> origin,
                                           std::vector<uint64_t> shape) {
  std::vector<std::vector<uint64_t>> result;
  IterateOverIndexRange(origin, shape, [&](absl::Span<const uint64_t> x) {
    result.emplace_back(x.begin(), x.end());
  });
  return result;
}

TEST(IterateOverIndexRangeTest, RowMajorWithOrigin) {
  EXPECT_THAT(Collect({0, 1}, {2, 2}),
              ElementsAre(ElementsAre(0, 1), ElementsAre(0, 2),
                          ElementsAre(1, 1), ElementsAre(1, 2)));
}

TEST(IterateOverIndexRangeTest, ThreeDimensions) {
  auto positions = Collect({1, 0, 2}, {1, 2, 2});
  EXPECT_THAT(positions,
              ElementsAre(ElementsAre(1, 0, 2), ElementsAre(1, 0, 3),
                          ElementsAre(1, 1, 2), ElementsAre(1, 1, 3)));
}

TEST(IterateOverIndexRangeTest, ZeroRank) {
  EXPECT_THAT(Collect({}, {}), ElementsAre(ElementsAre()));
}

TEST(IterateOverIndexRangeTest, ZeroExtent) {
  EXPECT_THAT(Collect({0, 0}, {2, 0}), ElementsAre());
  EXPECT_THAT(Collect({0, 0}, {0, 2}), ElementsAre());
}

}  // namespace
