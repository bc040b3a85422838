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

#include "omfile/format/chunk_index.h"

#include <limits>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/testing/om_file_builder.h"
#include "omfile/util/status_testutil.h"

namespace {

using ::omfile::ByteRange;
using ::omfile::ChunkIndexLayout;
using ::omfile::ErrorKind;
using ::omfile::HasErrorKind;
using ::omfile::IsOkAndHolds;
using ::omfile::internal_testing::PutLE64;

using Encoding = ChunkIndexLayout::Encoding;

TEST(ChunkIndexLayoutTest, OffsetLengthSpans) {
  OMFILE_ASSERT_OK_AND_ASSIGN(
      auto layout, ChunkIndexLayout::Make(Encoding::kOffsetLength, 1000, 4));
  EXPECT_EQ((ByteRange{1000, 1064}), layout.table_byte_range());
  EXPECT_EQ((ByteRange{1000, 1016}), layout.IndexSpan(0));
  EXPECT_EQ((ByteRange{1048, 1064}), layout.IndexSpan(3));
}

TEST(ChunkIndexLayoutTest, OffsetLengthDecode) {
  OMFILE_ASSERT_OK_AND_ASSIGN(
      auto layout, ChunkIndexLayout::Make(Encoding::kOffsetLength, 1000, 4));
  std::string entry;
  PutLE64(entry, 200);
  PutLE64(entry, 30);
  EXPECT_THAT(layout.DecodeEntry(2, entry), IsOkAndHolds(ByteRange{200, 230}));
  EXPECT_THAT(layout.DecodeEntry(2, entry.substr(0, 8)),
              HasErrorKind(ErrorKind::kDecodeError));
}

TEST(ChunkIndexLayoutTest, OffsetLengthOverflow) {
  OMFILE_ASSERT_OK_AND_ASSIGN(
      auto layout, ChunkIndexLayout::Make(Encoding::kOffsetLength, 0, 1));
  std::string entry;
  PutLE64(entry, std::numeric_limits<uint64_t>::max());
  PutLE64(entry, 1);
  EXPECT_THAT(layout.DecodeEntry(0, entry),
              HasErrorKind(ErrorKind::kDecodeError));
}

// Entry `i` of a legacy table ends chunk `i`; chunk 0 starts at the data
// section.
TEST(ChunkIndexLayoutTest, LegacySpans) {
  OMFILE_ASSERT_OK_AND_ASSIGN(
      auto layout, ChunkIndexLayout::Make(Encoding::kLegacyEndOffsets, 40, 3));
  EXPECT_EQ((ByteRange{40, 64}), layout.table_byte_range());
  EXPECT_EQ((ByteRange{40, 48}), layout.IndexSpan(0));
  EXPECT_EQ((ByteRange{40, 56}), layout.IndexSpan(1));
  EXPECT_EQ((ByteRange{48, 64}), layout.IndexSpan(2));
}

TEST(ChunkIndexLayoutTest, LegacyDecode) {
  OMFILE_ASSERT_OK_AND_ASSIGN(
      auto layout, ChunkIndexLayout::Make(Encoding::kLegacyEndOffsets, 40, 3));
  std::string table;
  PutLE64(table, 10);
  PutLE64(table, 25);
  PutLE64(table, 27);
  EXPECT_THAT(layout.DecodeEntry(0, table.substr(0, 8)),
              IsOkAndHolds(ByteRange{64, 74}));
  EXPECT_THAT(layout.DecodeEntry(1, table.substr(0, 16)),
              IsOkAndHolds(ByteRange{74, 89}));
  EXPECT_THAT(layout.DecodeEntry(2, table.substr(8, 16)),
              IsOkAndHolds(ByteRange{89, 91}));
}

TEST(ChunkIndexLayoutTest, LegacyInverted) {
  OMFILE_ASSERT_OK_AND_ASSIGN(
      auto layout, ChunkIndexLayout::Make(Encoding::kLegacyEndOffsets, 40, 2));
  std::string table;
  PutLE64(table, 10);
  PutLE64(table, 5);
  EXPECT_THAT(layout.DecodeEntry(1, table),
              HasErrorKind(ErrorKind::kDecodeError));
}

TEST(ChunkIndexLayoutTest, MakeOverflow) {
  EXPECT_THAT(ChunkIndexLayout::Make(Encoding::kOffsetLength, 16,
                                     std::numeric_limits<uint64_t>::max() / 16),
              HasErrorKind(ErrorKind::kDecodeError));
}

}  // namespace
