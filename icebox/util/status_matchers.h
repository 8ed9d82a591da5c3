// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef ICEBOX_UTIL_STATUS_MATCHERS_H_
#define ICEBOX_UTIL_STATUS_MATCHERS_H_

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "icebox/util/status_macros.h"

#define ICEBOX_ASSERT_OK(expr) ASSERT_THAT(expr, ::icebox::IsOk())

#define ICEBOX_ASSERT_OK_AND_ASSIGN(lhs, rexpr) \
  ICEBOX_ASSERT_OK_AND_ASSIGN_IMPL(             \
      ICEBOX_MACROS_IMPL_CONCAT(_icebox_statusor, __LINE__), lhs, rexpr)

#define ICEBOX_ASSERT_OK_AND_ASSIGN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                     \
  ASSERT_THAT(statusor.status(), ::icebox::IsOk());            \
  lhs = std::move(statusor).value()

namespace icebox {
namespace internal {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& statusor) {
  return statusor.status();
}

template <typename Enum>
class StatusIsMatcher {
 public:
  StatusIsMatcher(const StatusIsMatcher&) = default;
  StatusIsMatcher& operator=(const StatusIsMatcher&) = default;

  StatusIsMatcher(Enum code, testing::Matcher<const std::string&> message)
      : code_(code), message_(std::move(message)) {}

  template <typename T>
  bool MatchAndExplain(const T& value,
                       testing::MatchResultListener* listener) const {
    const absl::Status& status = GetStatus(value);
    *listener << "whose status is " << status;
    return status.code() == code_ &&
           message_.MatchAndExplain(std::string(status.message()), listener);
  }

  void DescribeTo(std::ostream* os) const {
    *os << "has a status code that is " << absl::StatusCodeToString(code_)
        << ", and has an error message that ";
    message_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "has a status code that is not " << absl::StatusCodeToString(code_)
        << ", or has an error message that ";
    message_.DescribeNegationTo(os);
  }

 private:
  Enum code_;
  testing::Matcher<const std::string&> message_;
};

class IsOkMatcher {
 public:
  template <typename T>
  bool MatchAndExplain(const T& value,
                       testing::MatchResultListener* listener) const {
    const absl::Status& status = GetStatus(value);
    if (!status.ok()) {
      *listener << "whose status is " << status;
      return false;
    }
    return true;
  }

  void DescribeTo(std::ostream* os) const { *os << "is OK"; }

  void DescribeNegationTo(std::ostream* os) const { *os << "is not OK"; }
};

}  // namespace internal

inline testing::PolymorphicMatcher<internal::IsOkMatcher> IsOk() {
  return testing::MakePolymorphicMatcher(internal::IsOkMatcher{});
}

template <typename Enum, typename Message>
testing::PolymorphicMatcher<internal::StatusIsMatcher<Enum>> StatusIs(
    Enum code, Message&& message) {
  return testing::MakePolymorphicMatcher(internal::StatusIsMatcher<Enum>(
      code, testing::MatcherCast<const std::string&>(
                std::forward<Message>(message))));
}

template <typename Enum>
testing::PolymorphicMatcher<internal::StatusIsMatcher<Enum>> StatusIs(
    Enum code) {
  return StatusIs(code, testing::_);
}

}  // namespace icebox

#endif  // ICEBOX_UTIL_STATUS_MATCHERS_H_
