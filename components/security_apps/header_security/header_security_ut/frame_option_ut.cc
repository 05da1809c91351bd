#include "frame_option.h"

#include <sstream>

#include "cptest.h"

using namespace std;
using namespace testing;

TEST(FrameOptionTest, wire_tokens)
{
    EXPECT_EQ(getFrameOptionToken(FrameOption::DENY), "DENY");
    EXPECT_EQ(getFrameOptionToken(FrameOption::SAME_ORIGIN), "SAMEORIGIN");
    EXPECT_EQ(getFrameOptionToken(FrameOption::ALLOW_FROM), "ALLOW-FROM");
}

TEST(FrameOptionTest, parse_is_case_insensitive)
{
    EXPECT_THAT(parseFrameOption("DENY"), IsValue(FrameOption::DENY));
    EXPECT_THAT(parseFrameOption("deny"), IsValue(FrameOption::DENY));
    EXPECT_THAT(parseFrameOption("SameOrigin"), IsValue(FrameOption::SAME_ORIGIN));
    EXPECT_THAT(parseFrameOption("allow-from"), IsValue(FrameOption::ALLOW_FROM));
}

TEST(FrameOptionTest, unknown_tokens)
{
    EXPECT_THAT(parseFrameOption("ALLOW_FROM"), IsError("Unknown X-Frame-Options value: \"ALLOW_FROM\""));
    EXPECT_THAT(parseFrameOption("SAME_ORIGIN"), IsError(HasSubstr("SAME_ORIGIN")));
    EXPECT_THAT(parseFrameOption(" DENY"), IsError(_));
    EXPECT_THAT(parseFrameOption(""), IsError("Unknown X-Frame-Options value: \"\""));
}

TEST(FrameOptionTest, printing)
{
    stringstream os;
    os << FrameOption::SAME_ORIGIN;
    EXPECT_EQ(os.str(), "SAMEORIGIN");
}
