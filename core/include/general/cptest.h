// Copyright (C) 2022 Check Point Software Technologies Ltd. All rights reserved.

// Licensed under the Apache License, Version 2.0 (the "License");
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#if !defined(__CP_TEST_H__)
#define __CP_TEST_H__

//
// Definitions which are useful in many unit tests
//

#include <string>
#include <ostream>
#include <iostream>

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "maybe_res.h"

// Death tests match on stderr, so assertion messages are sent there. The "threadsafe" style re-executes
// the test binary instead of forking it.
inline void
cptestPrepareToDie()
{
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    Debug::setNewDefaultStdout(&std::cerr);
}

namespace testing
{

namespace maybe_matcher
{

// Verifies Maybe<T>::ok() is as expected, then runs the inner matcher on the value or on the error.
template <typename MaybeType, typename GetInternal>
class BaseMatcher : public MatcherInterface<MaybeType>
{
    using InternalValue = decltype(GetInternal::get(std::declval<MaybeType>()));

public:
    BaseMatcher(const Matcher<InternalValue> &_matcher)
            :
        label(GetInternal::expected_ok ? "Value" : "Error"),
        matcher(_matcher)
    {
    }

    bool
    MatchAndExplain(MaybeType m, MatchResultListener *listener) const override
    {
        if (m.ok() != GetInternal::expected_ok) return false;
        return matcher.MatchAndExplain(GetInternal::get(m), listener);
    }

    // LCOV_EXCL_START - Only called when a test fails, to explain why.
    void
    DescribeTo(::std::ostream *os) const override
    {
        *os << label << "(";
        matcher.DescribeTo(os);
        *os << ")";
    }

    void
    DescribeNegationTo(::std::ostream *os) const override
    {
        *os << label << "(";
        matcher.DescribeNegationTo(os);
        *os << ")";
    }
    // LCOV_EXCL_STOP

private:
    std::string label;
    Matcher<InternalValue> matcher;
};

// The Maybe type is only known once the matcher is cast, so the real matcher is built then.
template <typename InternalMatcherType, typename InternalValueGetter>
class TempMatcher
{
public:
    TempMatcher(InternalMatcherType _matcher) : matcher(_matcher) {}

    template <typename MaybeType>
    operator Matcher<MaybeType>() const
    {
        return MakeMatcher(new BaseMatcher<MaybeType, InternalValueGetter>(matcher));
    }

private:
    InternalMatcherType matcher;
};

class GetValue
{
public:
    static const bool expected_ok = true;

    template<typename T, typename TErr>
    static T get(const Maybe<T, TErr> &m) { return m.unpack(); }
};

class GetError
{
public:
    static const bool expected_ok = false;

    template<typename T, typename TErr>
    static TErr get(const Maybe<T, TErr> &m) { return m.getErr(); }
};

} // namespace maybe_matcher

// Usage:
//   EXPECT_THAT(m, IsValue(3));     // Must hold 3
//   EXPECT_THAT(m, IsValue(_));     // Must be a value
//   EXPECT_THAT(m, IsError("HA"));  // Must be an error with specific text
//   EXPECT_THAT(m, IsError(_));     // Any error (but not a value)
template<typename MatcherType>
static inline maybe_matcher::TempMatcher<MatcherType, maybe_matcher::GetValue>
IsValue(MatcherType matcher)
{
    return maybe_matcher::TempMatcher<MatcherType, maybe_matcher::GetValue>(matcher);
}

template<typename MatcherType>
static inline maybe_matcher::TempMatcher<MatcherType, maybe_matcher::GetError>
IsError(MatcherType matcher)
{
    return maybe_matcher::TempMatcher<MatcherType, maybe_matcher::GetError>(matcher);
}

} // namespace testing

#endif // __CP_TEST_H__
