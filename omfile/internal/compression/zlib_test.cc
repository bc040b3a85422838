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

#include "omfile/internal/compression/zlib.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "omfile/util/status_testutil.h"

namespace {

using ::omfile::IsOk;
using ::omfile::MatchesStatus;

namespace zlib = ::omfile::zlib;

// Encoding appends to the output without clearing existing contents.
TEST(ZlibTest, SmallRoundtrip) {
  const std::string input = "The quick brown fox jumped over the lazy dog.";
  absl::Cord encoded("abc"), decoded("def");
  zlib::Encode(absl::Cord(input), &encoded, 6);
  ASSERT_GE(encoded.size(), 3);
  EXPECT_EQ("abc", std::string(encoded.Subcord(0, 3)));
  EXPECT_THAT(zlib::Decode(encoded.Subcord(3, encoded.size() - 3), &decoded,
                           input.size()),
              IsOk());
  EXPECT_EQ("def" + input, std::string(decoded));
}

// Exceeds the 16KiB stream buffer.
TEST(ZlibTest, LargeRoundtrip) {
  std::string input(100000, '\0');
  unsigned char x = 0;
  for (auto& v : input) {
    v = x;
    x += 7;
  }
  absl::Cord encoded, decoded;
  zlib::Encode(absl::Cord(input), &encoded);
  EXPECT_THAT(zlib::Decode(encoded, &decoded, input.size()), IsOk());
  EXPECT_EQ(input, std::string(decoded));
}

TEST(ZlibTest, FragmentedInput) {
  const std::string input(5000, 'x');
  absl::Cord encoded;
  zlib::Encode(absl::Cord(input), &encoded);
  std::string flat(encoded);
  absl::Cord fragmented;
  for (char c : flat) fragmented.Append(std::string(1, c));
  absl::Cord decoded;
  EXPECT_THAT(zlib::Decode(fragmented, &decoded, input.size()), IsOk());
  EXPECT_EQ(input, std::string(decoded));
}

TEST(ZlibTest, DecodeCorruptData) {
  const std::string input = "The quick brown fox jumped over the lazy dog.";
  absl::Cord encoded;
  zlib::Encode(absl::Cord(input), &encoded);
  std::string flat(encoded);

  {
    std::string corrupt = flat;
    corrupt[0] = 0;
    absl::Cord decoded;
    EXPECT_THAT(zlib::Decode(absl::Cord(corrupt), &decoded, 1000),
                MatchesStatus(absl::StatusCode::kInvalidArgument));
  }
  {
    absl::Cord decoded;
    EXPECT_THAT(zlib::Decode(absl::Cord(flat.substr(0, flat.size() - 1)),
                             &decoded, 1000),
                MatchesStatus(absl::StatusCode::kInvalidArgument));
  }
  {
    absl::Cord decoded;
    EXPECT_THAT(zlib::Decode(absl::Cord(flat + "a"), &decoded, 1000),
                MatchesStatus(absl::StatusCode::kInvalidArgument));
  }
}

TEST(ZlibTest, DecodeExceedsLimit) {
  const std::string input(1000, 'y');
  absl::Cord encoded, decoded;
  zlib::Encode(absl::Cord(input), &encoded);
  EXPECT_THAT(zlib::Decode(encoded, &decoded, 999),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            ".*exceeds 999 bytes"));
}

}  // namespace
