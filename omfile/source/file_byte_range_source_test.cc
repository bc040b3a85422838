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

#include "omfile/source/file_byte_range_source.h"

#include <stdio.h>

#include <fstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/util/status_testutil.h"

namespace {

using ::omfile::ByteRange;
using ::omfile::FileByteRangeSource;
using ::omfile::IsOkAndHolds;
using ::omfile::MatchesStatus;

// Writes `contents` to a file in the test temporary directory and removes it
// on destruction.
class ScopedTestFile {
 public:
  ScopedTestFile(const std::string& name, const std::string& contents)
      : path_(::testing::TempDir() + "/" + name) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out << contents;
  }
  ~ScopedTestFile() { ::remove(path_.c_str()); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

TEST(FileByteRangeSourceTest, Read) {
  ScopedTestFile file("file_source_read", "0123456789");
  OMFILE_ASSERT_OK_AND_ASSIGN(auto source,
                              FileByteRangeSource::Open(file.path()));
  EXPECT_EQ(file.path(), source->path());
  EXPECT_THAT(source->Size(), IsOkAndHolds(10));
  EXPECT_THAT(source->Read(ByteRange{3, 7}), IsOkAndHolds(absl::Cord("3456")));
  EXPECT_THAT(source->Read(ByteRange{0, 0}), IsOkAndHolds(absl::Cord()));
}

// Exceeds the size of a single cord buffer.
TEST(FileByteRangeSourceTest, LargeRead) {
  std::string contents(200000, '\0');
  for (size_t i = 0; i < contents.size(); ++i) {
    contents[i] = static_cast<char>(i * 13);
  }
  ScopedTestFile file("file_source_large", contents);
  OMFILE_ASSERT_OK_AND_ASSIGN(auto source,
                              FileByteRangeSource::Open(file.path()));
  OMFILE_ASSERT_OK_AND_ASSIGN(auto value,
                              source->Read(ByteRange{5, 190005}));
  EXPECT_EQ(contents.substr(5, 190000), std::string(value));
}

TEST(FileByteRangeSourceTest, ReadPastEnd) {
  ScopedTestFile file("file_source_past_end", "0123456789");
  OMFILE_ASSERT_OK_AND_ASSIGN(auto source,
                              FileByteRangeSource::Open(file.path()));
  EXPECT_THAT(source->Read(ByteRange{8, 12}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST(FileByteRangeSourceTest, OpenMissing) {
  EXPECT_THAT(FileByteRangeSource::Open(::testing::TempDir() +
                                        "/file_source_does_not_exist"),
              MatchesStatus(absl::StatusCode::kNotFound));
}

}  // namespace
