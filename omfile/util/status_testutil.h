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

#ifndef OMFILE_UTIL_STATUS_TESTUTIL_H_
#define OMFILE_UTIL_STATUS_TESTUTIL_H_

/// \file
/// Implements GMock matchers for absl::Status and Result.
/// For example, to test an Ok result, perhaps with a value, use:
///
///   EXPECT_THAT(DoSomething(), ::omfile::IsOk());
///   EXPECT_THAT(DoSomething(), ::omfile::IsOkAndHolds(7));
///
/// A shorthand for IsOk() is provided:
///
///   OMFILE_EXPECT_OK(DoSomething());
///
/// To test an error expectation, use:
///
///   EXPECT_THAT(DoSomething(),
///               ::omfile::StatusIs(absl::StatusCode::kInternal));
///   EXPECT_THAT(DoSomething(),
///               ::omfile::MatchesStatus(absl::StatusCode::kInternal,
///               "foo.*"));
///
/// To test the error kind carried in the status payload, use:
///
///   EXPECT_THAT(DoSomething(),
///               ::omfile::HasErrorKind(ErrorKind::kDecodeError));

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "omfile/errors.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"

namespace omfile {
namespace internal_status {

// Monomorphic implementation of matcher IsOkAndHolds(m).
// StatusType is a const reference to Status or Result<T>.
template <typename StatusType>
class IsOkAndHoldsMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  typedef
      typename std::remove_reference<StatusType>::type::value_type value_type;

  template <typename InnerMatcher>
  explicit IsOkAndHoldsMatcherImpl(InnerMatcher&& inner_matcher)
      : inner_matcher_(::testing::SafeMatcherCast<const value_type&>(
            std::forward<InnerMatcher>(inner_matcher))) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "is OK and has a value that ";
    inner_matcher_.DescribeTo(os);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "isn't OK or has a value that ";
    inner_matcher_.DescribeNegationTo(os);
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::omfile::GetStatus(actual_value);  // avoid ADL.
    if (!status.ok()) {
      *result_listener << "whose status code is "
                       << absl::StatusCodeToString(status.code());
      return false;
    }
    ::testing::StringMatchResultListener inner_listener;
    if (!inner_matcher_.MatchAndExplain(actual_value.value(),
                                        &inner_listener)) {
      *result_listener << "whose value "
                       << ::testing::PrintToString(actual_value.value())
                       << " doesn't match";
      if (!inner_listener.str().empty()) {
        *result_listener << ", " << inner_listener.str();
      }
      return false;
    }
    return true;
  }

 private:
  const ::testing::Matcher<const value_type&> inner_matcher_;
};

// Implements IsOkAndHolds(m) as a polymorphic matcher.
template <typename InnerMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(InnerMatcher inner_matcher)
      : inner_matcher_(std::move(inner_matcher)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new IsOkAndHoldsMatcherImpl<const StatusType&>(inner_matcher_));
  }

 private:
  const InnerMatcher inner_matcher_;
};

// Monomorphic implementation of matcher IsOk() for a given type T.
template <typename StatusType>
class MonoIsOkMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  void DescribeTo(std::ostream* os) const override { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "is not OK";
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::omfile::GetStatus(actual_value);  // avoid ADL.
    if (!status.ok()) *result_listener << status;
    return status.ok();
  }
};

// Implements IsOk() as a polymorphic matcher.
class IsOkMatcher {
 public:
  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new MonoIsOkMatcherImpl<const StatusType&>());
  }
};

// Monomorphic implementation of matcher StatusIs().
template <typename StatusType>
class StatusIsMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  explicit StatusIsMatcherImpl(
      testing::Matcher<absl::StatusCode> code_matcher,
      testing::Matcher<const std::string&> message_matcher)
      : code_matcher_(std::move(code_matcher)),
        message_matcher_(std::move(message_matcher)) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "has a status code that ";
    code_matcher_.DescribeTo(os);
    *os << ", and has an error message that ";
    message_matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const override {
    *os << "has a status code that ";
    code_matcher_.DescribeNegationTo(os);
    *os << ", or has an error message that ";
    message_matcher_.DescribeNegationTo(os);
  }

  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::omfile::GetStatus(actual_value);  // avoid ADL.

    testing::StringMatchResultListener inner_listener;
    if (!code_matcher_.MatchAndExplain(status.code(), &inner_listener)) {
      *result_listener << "whose status code "
                       << absl::StatusCodeToString(status.code())
                       << " doesn't match";
      const std::string inner_explanation = inner_listener.str();
      if (!inner_explanation.empty()) {
        *result_listener << ", " << inner_explanation;
      }
      return false;
    }

    if (!message_matcher_.Matches(std::string(status.message()))) {
      *result_listener << "whose error message is wrong";
      return false;
    }

    return true;
  }

 private:
  const testing::Matcher<absl::StatusCode> code_matcher_;
  const testing::Matcher<const std::string&> message_matcher_;
};

// Implements StatusIs() as a polymorphic matcher.
class StatusIsMatcher {
 public:
  StatusIsMatcher(testing::Matcher<absl::StatusCode> code_matcher,
                  testing::Matcher<const std::string&> message_matcher)
      : code_matcher_(std::move(code_matcher)),
        message_matcher_(std::move(message_matcher)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new StatusIsMatcherImpl<const StatusType&>(code_matcher_,
                                                   message_matcher_));
  }

 private:
  const testing::Matcher<absl::StatusCode> code_matcher_;
  const testing::Matcher<const std::string&> message_matcher_;
};

// Monomorphic implementation of matcher HasErrorKind().
template <typename StatusType>
class HasErrorKindMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  explicit HasErrorKindMatcherImpl(ErrorKind kind) : kind_(kind) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "has error kind " << kind_;
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "doesn't have error kind " << kind_;
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::omfile::GetStatus(actual_value);  // avoid ADL.
    auto kind = GetErrorKind(status);
    if (!kind) {
      *result_listener << "whose status " << status << " has no error kind";
      return false;
    }
    if (*kind != kind_) {
      *result_listener << "whose error kind is " << *kind;
      return false;
    }
    return true;
  }

 private:
  const ErrorKind kind_;
};

class HasErrorKindMatcher {
 public:
  explicit HasErrorKindMatcher(ErrorKind kind) : kind_(kind) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new HasErrorKindMatcherImpl<const StatusType&>(kind_));
  }

 private:
  const ErrorKind kind_;
};

}  // namespace internal_status

// Returns a gMock matcher that matches an OK Status/Result.
inline internal_status::IsOkMatcher IsOk() {
  return internal_status::IsOkMatcher();
}

// Returns a gMock matcher that matches an OK Status/Result
// and whose value matches the inner matcher.
template <typename InnerMatcher>
internal_status::IsOkAndHoldsMatcher<typename std::decay<InnerMatcher>::type>
IsOkAndHolds(InnerMatcher&& inner_matcher) {
  return internal_status::IsOkAndHoldsMatcher<
      typename std::decay<InnerMatcher>::type>(
      std::forward<InnerMatcher>(inner_matcher));
}

// Returns a matcher that matches a Status/Result whose code
// matches code_matcher, and whose error message matches message_matcher.
template <typename CodeMatcher, typename MessageMatcher>
internal_status::StatusIsMatcher StatusIs(CodeMatcher code_matcher,
                                          MessageMatcher message_matcher) {
  return internal_status::StatusIsMatcher(std::move(code_matcher),
                                          std::move(message_matcher));
}

// Returns a matcher that matches a Status/Result whose code
// matches code_matcher.
template <typename CodeMatcher>
internal_status::StatusIsMatcher StatusIs(CodeMatcher code_matcher) {
  return internal_status::StatusIsMatcher(std::move(code_matcher),
                                          ::testing::_);
}

// Returns a matcher that matches a Status/Result whose code
// is code_matcher.
inline internal_status::StatusIsMatcher MatchesStatus(
    absl::StatusCode status_code) {
  return internal_status::StatusIsMatcher(status_code, ::testing::_);
}

// Returns a matcher that matches a Status/Result whose code
// is code_matcher, and whose message matches the provided regex pattern.
internal_status::StatusIsMatcher MatchesStatus(
    absl::StatusCode status_code, const std::string& message_pattern);

// Returns a matcher that matches a Status/Result whose error kind payload is
// `kind`.
inline internal_status::HasErrorKindMatcher HasErrorKind(ErrorKind kind) {
  return internal_status::HasErrorKindMatcher(kind);
}

}  // namespace omfile

/// EXPECT assertion that the argument, when converted to an `absl::Status` via
/// `omfile::GetStatus`, has a code of `absl::StatusCode::kOk`.
#define OMFILE_EXPECT_OK(expr) EXPECT_THAT(expr, ::omfile::IsOk())

/// Same as `OMFILE_EXPECT_OK`, but returns in the case of an error.
#define OMFILE_ASSERT_OK(expr) ASSERT_THAT(expr, ::omfile::IsOk())

/// ASSERTs that `expr` is a `omfile::Result` with a value, and assigns the
/// value to `decl`.
///
/// Example:
///
///     omfile::Result<int> GetResult();
///
///     OMFILE_ASSERT_OK_AND_ASSIGN(int x, GetResult());
#define OMFILE_ASSERT_OK_AND_ASSIGN(decl, expr)                      \
  OMFILE_ASSIGN_OR_RETURN(decl, expr,                                \
                          ([&] { FAIL() << #expr << ": " << _; })()) \
  /**/

#endif  // OMFILE_UTIL_STATUS_TESTUTIL_H_
