#include "buffered_http_response.h"

#include <string>
#include <vector>

#include "cptest.h"

using namespace std;
using namespace testing;

TEST(BufferedHttpResponseTest, new_response_state)
{
    BufferedHttpResponse response;
    EXPECT_FALSE(response.isCommitted());
    EXPECT_TRUE(response.supportsHeaders());
    EXPECT_EQ(response.getHeaderCount(), 0u);
    EXPECT_EQ(response.serializeHeaders(), "");
}

TEST(BufferedHttpResponseTest, headers_are_kept_in_order)
{
    BufferedHttpResponse response;
    response.addHeader("Content-Type", "text/html");
    response.addHeader("X-Frame-Options", "DENY");
    response.addHeader("Cache-Control", "no-store");

    EXPECT_EQ(response.getHeaderCount(), 3u);
    EXPECT_THAT(
        response.getAllHeaders(),
        ElementsAre(
            Pair("Content-Type", "text/html"),
            Pair("X-Frame-Options", "DENY"),
            Pair("Cache-Control", "no-store")
        )
    );
    EXPECT_EQ(
        response.serializeHeaders(),
        "Content-Type: text/html\r\n"
        "X-Frame-Options: DENY\r\n"
        "Cache-Control: no-store\r\n"
    );
}

TEST(BufferedHttpResponseTest, adding_appends_rather_than_replaces)
{
    BufferedHttpResponse response;
    response.addHeader("X-Frame-Options", "SAMEORIGIN");
    response.addHeader("x-frame-options", "DENY");

    EXPECT_THAT(response.getHeaders("X-Frame-Options"), ElementsAre("SAMEORIGIN", "DENY"));
    EXPECT_THAT(response.getHeaders("X-FRAME-OPTIONS"), ElementsAre("SAMEORIGIN", "DENY"));
    EXPECT_THAT(response.getHeaders("Strict-Transport-Security"), IsEmpty());
}

TEST(BufferedHttpResponseTest, committed_response_rejects_headers)
{
    BufferedHttpResponse response;
    response.addHeader("Content-Type", "text/html");
    response.commit();
    EXPECT_TRUE(response.isCommitted());

    try {
        response.addHeader("X-Frame-Options", "DENY");
        FAIL() << "Header was added to a committed response";
    } catch (const FilterLifecycleException &e) {
        EXPECT_EQ(e.getError(), "Cannot add header \"X-Frame-Options\" to a committed response");
    }
    EXPECT_EQ(response.getHeaderCount(), 1u);
}

TEST(BufferedHttpResponseTest, non_http_response_has_no_headers)
{
    BufferedHttpResponse response(BufferedHttpResponse::Protocol::OTHER);
    EXPECT_FALSE(response.supportsHeaders());
    EXPECT_THROW(response.addHeader("X-Frame-Options", "DENY"), FilterLifecycleException);
    EXPECT_EQ(response.getHeaderCount(), 0u);
}
