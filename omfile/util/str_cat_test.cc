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

#include "omfile/util/str_cat.h"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/types/span.h"
#include "omfile/format/data_type.h"
#include "omfile/range.h"

namespace {

using ::omfile::Range;
using ::omfile::StrCat;

TEST(StrCatTest, Basic) {
  EXPECT_EQ("ab1.5", StrCat("a", std::string("b"), 1.5));
}

TEST(StrCatTest, Ostream) {
  EXPECT_EQ("[2, 5)", StrCat(Range{2, 5}));
  EXPECT_EQ("type=float", StrCat("type=", omfile::DataType::kFloat));
}

TEST(StrCatTest, Container) {
  std::vector<int> v{1, 2, 3};
  EXPECT_EQ("{1, 2, 3}", StrCat(v));
  const Range ranges[] = {Range{0, 1}, Range{2, 3}};
  EXPECT_EQ("{[0, 1), [2, 3)}",
            StrCat(absl::Span<const Range>(ranges)));
}

TEST(StrAppendTest, Basic) {
  std::string result = "x";
  omfile::StrAppend(&result, Range{1, 2}, 3);
  EXPECT_EQ("x[1, 2)3", result);
}

}  // namespace
