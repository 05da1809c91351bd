#include "header_security_filter.h"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "cereal/archives/json.hpp"
#include "cptest.h"
#include "debug.h"
#include "buffered_http_response.h"
#include "mock/mock_filter_request.h"
#include "mock/mock_filter_response.h"
#include "mock/mock_filter_chain.h"

using namespace std;
using namespace testing;

USE_DEBUG_FLAG(D_HEADER_SECURITY);

class HeaderSecurityFilterTest : public Test
{
public:
    HeaderSecurityFilterTest()
    {
        Debug::setNewDefaultStdout(&debug_output);
        Debug::setUnitTestFlag(D_HEADER_SECURITY, Debug::DebugLevel::TRACE);
        ON_CALL(secure_request, isSecure()).WillByDefault(Return(true));
        ON_CALL(plain_request, isSecure()).WillByDefault(Return(false));
    }

    ~HeaderSecurityFilterTest()
    {
        Debug::resetConfiguration();
        Debug::setNewDefaultStdout(&cout);
    }

    HeaderSecurityConfig
    hstsConfig(int max_age_seconds, bool include_sub_domains)
    {
        HeaderSecurityConfig config;
        config.setHstsMaxAgeSeconds(max_age_seconds);
        config.setHstsIncludeSubDomains(include_sub_domains);
        return config;
    }

    stringstream debug_output;
    HeaderSecurityFilter filter;
    NiceMock<MockFilterRequest> secure_request;
    NiceMock<MockFilterRequest> plain_request;
    StrictMock<MockFilterChain> chain;
    BufferedHttpResponse response;
};

TEST_F(HeaderSecurityFilterTest, component_surface)
{
    EXPECT_EQ(filter.getName(), "HeaderSecurityFilter");
    EXPECT_TRUE(filter.isConfigProblemFatal());
    EXPECT_EQ(HeaderSecurityFilter::hsts_header_name, "Strict-Transport-Security");
    EXPECT_EQ(HeaderSecurityFilter::anti_click_jacking_header_name, "X-Frame-Options");
}

TEST_F(HeaderSecurityFilterTest, default_header_values)
{
    filter.init();
    EXPECT_EQ(filter.getHstsHeaderValue(), "max-age=0");
    EXPECT_EQ(filter.getAntiClickJackingHeaderValue(), "DENY");
}

TEST_F(HeaderSecurityFilterTest, hsts_value_with_and_without_sub_domains)
{
    filter.init(hstsConfig(600, false));
    EXPECT_EQ(filter.getHstsHeaderValue(), "max-age=600");
    filter.fini();

    filter.init(hstsConfig(600, true));
    EXPECT_EQ(filter.getHstsHeaderValue(), "max-age=600;includeSubDomains");
}

TEST_F(HeaderSecurityFilterTest, negative_max_age_compiles_to_zero)
{
    for (int max_age : { -1, -31536000 }) {
        HeaderSecurityFilter negative_age_filter;
        negative_age_filter.init(hstsConfig(max_age, false));
        EXPECT_EQ(negative_age_filter.getHstsHeaderValue(), "max-age=0");
    }
}

TEST_F(HeaderSecurityFilterTest, deny_and_same_origin_ignore_uri)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingUri("https://partner.example.com");

    config.setAntiClickJackingOption(FrameOption::DENY);
    filter.init(config);
    EXPECT_EQ(filter.getAntiClickJackingHeaderValue(), "DENY");
    filter.fini();

    config.setAntiClickJackingOption(FrameOption::SAME_ORIGIN);
    filter.init(config);
    EXPECT_EQ(filter.getAntiClickJackingHeaderValue(), "SAMEORIGIN");
    filter.fini();

    config.setAntiClickJackingUri("not a uri");
    filter.init(config);
    EXPECT_EQ(filter.getAntiClickJackingHeaderValue(), "SAMEORIGIN");
}

TEST_F(HeaderSecurityFilterTest, allow_from_appends_uri)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingOption("ALLOW-FROM");
    config.setAntiClickJackingUri("https://partner.example.com");

    filter.init(config);
    EXPECT_EQ(filter.getAntiClickJackingHeaderValue(), "ALLOW-FROM:https://partner.example.com");
}

TEST_F(HeaderSecurityFilterTest, allow_from_without_uri_is_a_configuration_error)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingOption(FrameOption::ALLOW_FROM);

    try {
        filter.init(config);
        FAIL() << "ALLOW-FROM without a URI was accepted";
    } catch (const HeaderSecurityConfigException &e) {
        EXPECT_EQ(e.getError(), "antiClickJackingUri must be set when antiClickJackingOption is ALLOW-FROM");
    }

    EXPECT_EQ(filter.getHstsHeaderValue(), "");
    EXPECT_THROW(filter.doFilter(secure_request, response, chain), FilterLifecycleException);
}

TEST_F(HeaderSecurityFilterTest, allow_from_with_malformed_uri_is_a_configuration_error)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingOption(FrameOption::ALLOW_FROM);
    config.setAntiClickJackingUri("https://partner example.com");

    try {
        filter.init(config);
        FAIL() << "Malformed URI was accepted";
    } catch (const HeaderSecurityConfigException &e) {
        EXPECT_EQ(
            e.getError(),
            "Illegal antiClickJackingUri. Error: Illegal character in authority: \"partner example.com\""
        );
    }
}

TEST_F(HeaderSecurityFilterTest, failed_init_can_be_retried_with_a_fixed_configuration)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingOption(FrameOption::ALLOW_FROM);
    EXPECT_THROW(filter.init(config), HeaderSecurityConfigException);

    config.setAntiClickJackingUri("/frames");
    filter.init(config);
    EXPECT_EQ(filter.getAntiClickJackingHeaderValue(), "ALLOW-FROM:/frames");
}

TEST_F(HeaderSecurityFilterTest, init_twice_is_a_lifecycle_violation)
{
    filter.init();
    EXPECT_THROW(filter.init(), FilterLifecycleException);
    EXPECT_THROW(filter.setConfiguration(HeaderSecurityConfig()), FilterLifecycleException);
}

TEST_F(HeaderSecurityFilterTest, configuration_is_kept)
{
    filter.setConfiguration(hstsConfig(120, true));
    EXPECT_EQ(filter.getConfiguration().getHstsMaxAgeSeconds(), 120);
    EXPECT_TRUE(filter.getConfiguration().isHstsIncludeSubDomains());
}

TEST_F(HeaderSecurityFilterTest, secure_request_gets_both_headers)
{
    HeaderSecurityConfig config = hstsConfig(31536000, true);
    config.setAntiClickJackingOption("SAMEORIGIN");
    filter.init(config);

    EXPECT_CALL(chain, doFilter(Ref(secure_request), Ref(response))).Times(1);
    filter.doFilter(secure_request, response, chain);

    EXPECT_THAT(
        response.getAllHeaders(),
        ElementsAre(
            Pair("Strict-Transport-Security", "max-age=31536000;includeSubDomains"),
            Pair("X-Frame-Options", "SAMEORIGIN")
        )
    );
    EXPECT_THAT(
        debug_output.str(),
        HasSubstr("Adding Strict-Transport-Security: max-age=31536000;includeSubDomains")
    );
}

TEST_F(HeaderSecurityFilterTest, one_year_same_origin_scenario)
{
    HeaderSecurityConfig config = hstsConfig(31536000, false);
    config.setAntiClickJackingOption(FrameOption::SAME_ORIGIN);
    filter.init(config);

    EXPECT_CALL(chain, doFilter(_, _)).Times(1);
    filter.doFilter(secure_request, response, chain);

    EXPECT_EQ(
        response.serializeHeaders(),
        "Strict-Transport-Security: max-age=31536000\r\n"
        "X-Frame-Options: SAMEORIGIN\r\n"
    );
}

TEST_F(HeaderSecurityFilterTest, plain_request_gets_no_hsts)
{
    filter.init(hstsConfig(600, false));

    EXPECT_CALL(chain, doFilter(Ref(plain_request), Ref(response))).Times(1);
    filter.doFilter(plain_request, response, chain);

    EXPECT_THAT(response.getHeaders("Strict-Transport-Security"), IsEmpty());
    EXPECT_THAT(response.getHeaders("X-Frame-Options"), ElementsAre("DENY"));
}

TEST_F(HeaderSecurityFilterTest, disabled_hsts_does_not_ask_about_transport)
{
    HeaderSecurityConfig config;
    config.setHstsEnabled(false);
    filter.init(config);

    StrictMock<MockFilterRequest> request;
    EXPECT_CALL(request, isSecure()).Times(0);
    EXPECT_CALL(chain, doFilter(_, _));
    filter.doFilter(request, response, chain);

    EXPECT_THAT(response.getAllHeaders(), ElementsAre(Pair("X-Frame-Options", "DENY")));
}

TEST_F(HeaderSecurityFilterTest, disabled_anti_click_jacking_adds_no_frame_options)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingEnabled(false);
    config.setAntiClickJackingOption(FrameOption::SAME_ORIGIN);
    filter.init(config);

    EXPECT_CALL(chain, doFilter(_, _)).Times(2);
    filter.doFilter(secure_request, response, chain);

    BufferedHttpResponse plain_response;
    filter.doFilter(plain_request, plain_response, chain);

    EXPECT_THAT(response.getHeaders("X-Frame-Options"), IsEmpty());
    EXPECT_THAT(response.getHeaders("Strict-Transport-Security"), ElementsAre("max-age=0"));
    EXPECT_EQ(plain_response.getHeaderCount(), 0u);
}

TEST_F(HeaderSecurityFilterTest, existing_headers_are_kept)
{
    filter.init(hstsConfig(600, false));
    response.addHeader("x-frame-options", "SAMEORIGIN");
    response.addHeader("Strict-Transport-Security", "max-age=10");

    EXPECT_CALL(chain, doFilter(_, _));
    filter.doFilter(secure_request, response, chain);

    EXPECT_THAT(response.getHeaders("Strict-Transport-Security"), ElementsAre("max-age=10", "max-age=600"));
    EXPECT_THAT(response.getHeaders("X-Frame-Options"), ElementsAre("SAMEORIGIN", "DENY"));
}

TEST_F(HeaderSecurityFilterTest, response_without_headers_is_passed_on)
{
    filter.init(hstsConfig(600, true));

    BufferedHttpResponse other_response(BufferedHttpResponse::Protocol::OTHER);
    EXPECT_CALL(chain, doFilter(Ref(secure_request), Ref(other_response)));
    filter.doFilter(secure_request, other_response, chain);

    EXPECT_EQ(other_response.getHeaderCount(), 0u);
}

TEST_F(HeaderSecurityFilterTest, response_capabilities_are_consulted_before_adding)
{
    filter.init(hstsConfig(600, false));

    StrictMock<MockFilterResponse> mock_response;
    {
        InSequence seq;
        EXPECT_CALL(mock_response, isCommitted()).WillOnce(Return(false));
        EXPECT_CALL(mock_response, supportsHeaders()).WillOnce(Return(true));
        EXPECT_CALL(mock_response, addHeader("Strict-Transport-Security", "max-age=600"));
        EXPECT_CALL(mock_response, addHeader("X-Frame-Options", "DENY"));
        EXPECT_CALL(chain, doFilter(Ref(secure_request), Ref(mock_response)));
    }

    filter.doFilter(secure_request, mock_response, chain);
}

TEST_F(HeaderSecurityFilterTest, committed_response_is_a_lifecycle_violation)
{
    filter.init(hstsConfig(600, true));
    response.commit();

    EXPECT_CALL(chain, doFilter(_, _)).Times(0);
    try {
        filter.doFilter(secure_request, response, chain);
        FAIL() << "Committed response was accepted";
    } catch (const FilterLifecycleException &e) {
        EXPECT_EQ(e.getError(), "Unable to add HTTP headers since response is already committed");
    }

    EXPECT_EQ(response.getHeaderCount(), 0u);
    EXPECT_THAT(debug_output.str(), HasSubstr("Response was committed before the header security filter ran"));
}

TEST_F(HeaderSecurityFilterTest, committed_mock_response_is_not_touched)
{
    filter.init();

    StrictMock<MockFilterResponse> mock_response;
    EXPECT_CALL(mock_response, isCommitted()).WillOnce(Return(true));
    EXPECT_CALL(chain, doFilter(_, _)).Times(0);

    EXPECT_THROW(filter.doFilter(secure_request, mock_response, chain), FilterLifecycleException);
}

TEST_F(HeaderSecurityFilterTest, filter_before_init_is_a_lifecycle_violation)
{
    EXPECT_CALL(chain, doFilter(_, _)).Times(0);
    EXPECT_THROW(filter.doFilter(secure_request, response, chain), FilterLifecycleException);
    EXPECT_EQ(response.getHeaderCount(), 0u);
}

TEST_F(HeaderSecurityFilterTest, chain_failure_is_propagated)
{
    filter.init();

    EXPECT_CALL(chain, doFilter(_, _)).WillOnce(Throw(FilterLifecycleException("next stage failed")));
    EXPECT_THROW(filter.doFilter(secure_request, response, chain), FilterLifecycleException);
    EXPECT_EQ(response.getHeaderCount(), 2u);
}

TEST_F(HeaderSecurityFilterTest, fini_returns_to_uninitialized)
{
    filter.init();
    filter.fini();

    EXPECT_EQ(filter.getHstsHeaderValue(), "");
    EXPECT_THROW(filter.doFilter(secure_request, response, chain), FilterLifecycleException);
}

class TransportRequest : public I_FilterRequest
{
public:
    TransportRequest(bool _is_secure) : is_secure(_is_secure) {}

    bool isSecure() const override { return is_secure; }

private:
    bool is_secure;
};

class CountingChain : public I_FilterChain
{
public:
    void doFilter(I_FilterRequest &, I_FilterResponse &) override { ++calls; }

    atomic<int> calls{0};
};

TEST_F(HeaderSecurityFilterTest, concurrent_requests_share_one_filter)
{
    HeaderSecurityConfig config = hstsConfig(31536000, true);
    config.setAntiClickJackingOption(FrameOption::SAME_ORIGIN);
    filter.init(config);

    string debug_file_name = "/tmp/header_security_filter_ut_" + to_string(getpid()) + ".dbg";
    remove(debug_file_name.c_str());
    stringstream debug_config(
        "{"
        "    \"Streams\": ["
        "        { \"Output\": \"STDOUT\", \"D_HEADER_SECURITY\": \"Trace\" },"
        "        { \"Output\": \"" + debug_file_name + "\", \"D_HEADER_SECURITY\": \"Trace\" }"
        "    ]"
        "}"
    );
    {
        cereal::JSONInputArchive ar(debug_config);
        Debug::loadConfiguration(ar);
    }
    debug_output.str("");

    static const int num_threads = 8;
    static const int requests_per_thread = 200;
    static const int committed_every = 20;
    CountingChain counting_chain;
    atomic<int> bad_responses{0};
    atomic<int> lifecycle_violations{0};

    vector<thread> workers;
    for (int thread_id = 0; thread_id < num_threads; thread_id++) {
        workers.emplace_back(
            [&, thread_id] ()
            {
                TransportRequest request(thread_id % 2 == 0);
                for (int i = 0; i < requests_per_thread; i++) {
                    BufferedHttpResponse thread_response;
                    if (i % committed_every == 0) {
                        thread_response.commit();
                        try {
                            filter.doFilter(request, thread_response, counting_chain);
                        } catch (const FilterLifecycleException &) {
                            lifecycle_violations++;
                        }
                        continue;
                    }
                    filter.doFilter(request, thread_response, counting_chain);
                    size_t expected_headers = request.isSecure() ? 2 : 1;
                    if (thread_response.getHeaderCount() != expected_headers) bad_responses++;
                    if (thread_response.getHeaders("X-Frame-Options") != vector<string>{ "SAMEORIGIN" }) {
                        bad_responses++;
                    }
                }
            }
        );
    }
    for (auto &worker : workers) {
        worker.join();
    }

    Debug::resetConfiguration();

    static const int num_committed = num_threads * (requests_per_thread / committed_every);
    static const int num_served = num_threads * requests_per_thread - num_committed;
    EXPECT_EQ(counting_chain.calls.load(), num_served);
    EXPECT_EQ(lifecycle_violations.load(), num_committed);
    EXPECT_EQ(bad_responses.load(), 0);

    ifstream debug_file(debug_file_name);
    ASSERT_TRUE(debug_file.is_open());
    int hsts_lines = 0;
    int frame_options_lines = 0;
    int committed_lines = 0;
    string debug_line;
    while (getline(debug_file, debug_line)) {
        EXPECT_THAT(debug_line, StartsWith("[doFilter@header_security_filter.cc:"));
        if (Value(debug_line, EndsWith("] Adding Strict-Transport-Security: max-age=31536000;includeSubDomains"))) {
            hsts_lines++;
        } else if (Value(debug_line, EndsWith("] Adding X-Frame-Options: SAMEORIGIN"))) {
            frame_options_lines++;
        } else if (Value(debug_line, EndsWith("] Response was committed before the header security filter ran"))) {
            committed_lines++;
        } else {
            ADD_FAILURE() << "Unexpected debug line: " << debug_line;
        }
    }
    EXPECT_EQ(hsts_lines, num_served / 2);
    EXPECT_EQ(frame_options_lines, num_served);
    EXPECT_EQ(committed_lines, num_committed);

    stringstream stdout_lines(debug_output.str());
    int num_stdout_lines = 0;
    while (getline(stdout_lines, debug_line)) {
        if (Value(debug_line, HasSubstr("@header_security_filter.cc:"))) num_stdout_lines++;
    }
    EXPECT_EQ(num_stdout_lines, hsts_lines + frame_options_lines + committed_lines);

    remove(debug_file_name.c_str());
}
