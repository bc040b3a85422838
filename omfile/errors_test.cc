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

#include "omfile/errors.h"

#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "omfile/util/status.h"
#include "omfile/util/status_testutil.h"
#include "omfile/util/str_cat.h"

namespace {

using ::omfile::ErrorKind;
using ::omfile::GetErrorKind;
using ::omfile::HasErrorKind;
using ::omfile::MatchesStatus;

TEST(ErrorsTest, StatusCodes) {
  EXPECT_THAT(omfile::InvalidFormatError("x"),
              MatchesStatus(absl::StatusCode::kInvalidArgument, "x"));
  EXPECT_THAT(omfile::InvalidTrailerError("x"),
              MatchesStatus(absl::StatusCode::kDataLoss));
  EXPECT_THAT(omfile::NotInitializedError("x"),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(omfile::DimensionMismatchError("x"),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(omfile::RangeOutOfBoundsError("x"),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(omfile::BufferTooSmallError("x"),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(omfile::IndexOutOfRangeError("x"),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(omfile::DecodeError("x"),
              MatchesStatus(absl::StatusCode::kDataLoss));
  EXPECT_THAT(omfile::DataTypeMismatchError("x"),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(ErrorsTest, GetErrorKind) {
  EXPECT_EQ(ErrorKind::kBufferTooSmall,
            GetErrorKind(omfile::BufferTooSmallError("x")));
  EXPECT_EQ(ErrorKind::kDimensionMismatch,
            GetErrorKind(omfile::DimensionMismatchError("x")));
  EXPECT_EQ(std::nullopt, GetErrorKind(absl::OkStatus()));
  EXPECT_EQ(std::nullopt, GetErrorKind(absl::UnavailableError("io")));
}

// Annotation keeps the kind.
TEST(ErrorsTest, AnnotationPreservesKind) {
  auto status = omfile::MaybeAnnotateStatus(
      omfile::IndexOutOfRangeError("Child 3"), "Loading child");
  EXPECT_THAT(status,
              MatchesStatus(absl::StatusCode::kOutOfRange,
                            "Loading child: Child 3"));
  EXPECT_THAT(status, HasErrorKind(ErrorKind::kIndexOutOfRange));
}

TEST(ErrorsTest, AsDecodeError) {
  auto status = omfile::AsDecodeError(absl::InvalidArgumentError("corrupt"),
                                      "Decoding chunk");
  EXPECT_THAT(status,
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Decoding chunk: corrupt"));
  EXPECT_THAT(status, HasErrorKind(ErrorKind::kDecodeError));
  EXPECT_TRUE(omfile::AsDecodeError(absl::OkStatus(), "x").ok());
}

TEST(ErrorsTest, Ostream) {
  EXPECT_EQ("RangeOutOfBounds",
            omfile::StrCat(ErrorKind::kRangeOutOfBounds));
}

}  // namespace
