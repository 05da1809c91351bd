#include "uri.h"

#include <string>
#include <sstream>

#include "cptest.h"

using namespace std;
using namespace testing;

TEST(UriTest, absolute_uri)
{
    auto maybe_uri = Uri::parse("https://www.example.com:8443/frames/index.html?lang=en#top");
    ASSERT_TRUE(maybe_uri.ok());

    const Uri &uri = maybe_uri.unpack();
    EXPECT_TRUE(uri.isAbsolute());
    EXPECT_EQ(uri.getScheme(), "https");
    EXPECT_EQ(uri.getAuthority(), "www.example.com:8443");
    EXPECT_EQ(uri.getPath(), "/frames/index.html");
    EXPECT_EQ(uri.getQuery(), "lang=en");
    EXPECT_EQ(uri.getFragment(), "top");
    EXPECT_EQ(uri.toString(), "https://www.example.com:8443/frames/index.html?lang=en#top");
}

TEST(UriTest, uri_text_is_kept_as_given)
{
    EXPECT_THAT(Uri::parse("HTTPS://Example.COM"), IsValue(Property(&Uri::toString, "HTTPS://Example.COM")));
    EXPECT_THAT(Uri::parse("https://example.com/"), IsValue(Property(&Uri::toString, "https://example.com/")));
    EXPECT_THAT(Uri::parse("http://a/b%20c"), IsValue(Property(&Uri::toString, "http://a/b%20c")));
}

TEST(UriTest, relative_references)
{
    auto path_only = Uri::parse("/frames/index.html");
    ASSERT_TRUE(path_only.ok());
    EXPECT_FALSE(path_only->isAbsolute());
    EXPECT_EQ(path_only->getPath(), "/frames/index.html");

    auto network_path = Uri::parse("//cdn.example.com/a");
    ASSERT_TRUE(network_path.ok());
    EXPECT_FALSE(network_path->isAbsolute());
    EXPECT_EQ(network_path->getAuthority(), "cdn.example.com");

    EXPECT_THAT(Uri::parse("page.html"), IsValue(_));
    EXPECT_THAT(Uri::parse("?query=only"), IsValue(_));
}

TEST(UriTest, opaque_uri)
{
    auto mail = Uri::parse("mailto:security@example.com");
    ASSERT_TRUE(mail.ok());
    EXPECT_EQ(mail->getScheme(), "mailto");
    EXPECT_EQ(mail->getPath(), "security@example.com");
    EXPECT_EQ(mail->getAuthority(), "");
}

TEST(UriTest, empty_uri)
{
    EXPECT_THAT(Uri::parse(""), IsError("URI is empty"));
}

TEST(UriTest, illegal_characters)
{
    EXPECT_THAT(Uri::parse("https://example.com/a b"), IsError("Illegal character in path: \"/a b\""));
    EXPECT_THAT(Uri::parse("https://exa mple.com"), IsError("Illegal character in authority: \"exa mple.com\""));
    EXPECT_THAT(Uri::parse("https://example.com/?a=<b>"), IsError("Illegal character in query: \"a=<b>\""));
    EXPECT_THAT(Uri::parse("https://example.com/#a\"b"), IsError("Illegal character in fragment: \"a\"b\""));
    EXPECT_THAT(Uri::parse("1http://example.com"), IsError("Illegal character in scheme name: \"1http\""));
}

TEST(UriTest, bad_percent_escape)
{
    EXPECT_THAT(Uri::parse("https://example.com/%zz"), IsError(HasSubstr("Illegal character in path")));
    EXPECT_THAT(Uri::parse("https://example.com/%4"), IsError(HasSubstr("Illegal character in path")));
}

TEST(UriTest, missing_parts)
{
    EXPECT_THAT(Uri::parse("https:"), IsError("Expected scheme-specific part in URI: \"https:\""));
    EXPECT_THAT(Uri::parse("https://"), IsError("Expected authority in URI: \"https://\""));
}

TEST(UriTest, printing)
{
    auto uri = Uri::parse("https://example.com/frames");
    ASSERT_TRUE(uri.ok());

    stringstream os;
    os << uri.unpack();
    EXPECT_EQ(os.str(), "https://example.com/frames");

    stringstream maybe_os;
    maybe_os << uri;
    EXPECT_EQ(maybe_os.str(), "Value(https://example.com/frames)");
}

TEST(UriTest, equality_is_textual)
{
    EXPECT_EQ(Uri::parse("https://example.com").unpack(), Uri::parse("https://example.com").unpack());
    EXPECT_FALSE(Uri::parse("https://example.com").unpack() == Uri::parse("https://example.com/").unpack());
}
