#include "header_security_config.h"

#include <sstream>
#include <string>

#include "cptest.h"

using namespace std;
using namespace testing;

class HeaderSecurityConfigTest : public Test
{
public:
    Maybe<HeaderSecurityConfig>
    load(const string &header_security_section)
    {
        stringstream config_stream("{\"headerSecurity\": " + header_security_section + "}");
        return loadHeaderSecurityConfig(config_stream);
    }
};

TEST_F(HeaderSecurityConfigTest, defaults)
{
    HeaderSecurityConfig config;
    EXPECT_TRUE(config.isHstsEnabled());
    EXPECT_EQ(config.getHstsMaxAgeSeconds(), 0);
    EXPECT_FALSE(config.isHstsIncludeSubDomains());
    EXPECT_TRUE(config.isAntiClickJackingEnabled());
    EXPECT_EQ(config.getAntiClickJackingOption(), FrameOption::DENY);
    EXPECT_EQ(config.getAntiClickJackingOptionToken(), "DENY");
    EXPECT_EQ(config.getAntiClickJackingUri(), "");
}

TEST_F(HeaderSecurityConfigTest, negative_max_age_is_clamped)
{
    HeaderSecurityConfig config;
    config.setHstsMaxAgeSeconds(-1);
    EXPECT_EQ(config.getHstsMaxAgeSeconds(), 0);

    config.setHstsMaxAgeSeconds(31536000);
    EXPECT_EQ(config.getHstsMaxAgeSeconds(), 31536000);
}

TEST_F(HeaderSecurityConfigTest, option_setter_matches_case_insensitively)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingOption("sameorigin");
    EXPECT_EQ(config.getAntiClickJackingOption(), FrameOption::SAME_ORIGIN);
    EXPECT_EQ(config.getAntiClickJackingOptionToken(), "SAMEORIGIN");

    config.setAntiClickJackingOption("Allow-From");
    EXPECT_EQ(config.getAntiClickJackingOption(), FrameOption::ALLOW_FROM);
}

TEST_F(HeaderSecurityConfigTest, option_setter_rejects_unknown_token)
{
    HeaderSecurityConfig config;
    config.setAntiClickJackingOption(FrameOption::SAME_ORIGIN);
    try {
        config.setAntiClickJackingOption("EVERYWHERE");
        FAIL() << "Unknown option was accepted";
    } catch (const HeaderSecurityConfigException &e) {
        EXPECT_EQ(e.getError(), "Unknown X-Frame-Options value: \"EVERYWHERE\"");
    }
    EXPECT_EQ(config.getAntiClickJackingOption(), FrameOption::SAME_ORIGIN);
}

TEST_F(HeaderSecurityConfigTest, load_full_configuration)
{
    auto config = load(
        "{"
        "    \"hstsEnabled\": false,"
        "    \"hstsMaxAgeSeconds\": 31536000,"
        "    \"hstsIncludeSubDomains\": true,"
        "    \"antiClickJackingEnabled\": true,"
        "    \"antiClickJackingOption\": \"allow-from\","
        "    \"antiClickJackingUri\": \"https://partner.example.com\""
        "}"
    );
    ASSERT_TRUE(config.ok()) << config.getErr();

    EXPECT_FALSE(config->isHstsEnabled());
    EXPECT_EQ(config->getHstsMaxAgeSeconds(), 31536000);
    EXPECT_TRUE(config->isHstsIncludeSubDomains());
    EXPECT_TRUE(config->isAntiClickJackingEnabled());
    EXPECT_EQ(config->getAntiClickJackingOption(), FrameOption::ALLOW_FROM);
    EXPECT_EQ(config->getAntiClickJackingUri(), "https://partner.example.com");
}

TEST_F(HeaderSecurityConfigTest, absent_keys_keep_defaults)
{
    auto config = load("{ \"hstsMaxAgeSeconds\": 600 }");
    ASSERT_TRUE(config.ok()) << config.getErr();

    EXPECT_TRUE(config->isHstsEnabled());
    EXPECT_EQ(config->getHstsMaxAgeSeconds(), 600);
    EXPECT_FALSE(config->isHstsIncludeSubDomains());
    EXPECT_TRUE(config->isAntiClickJackingEnabled());
    EXPECT_EQ(config->getAntiClickJackingOption(), FrameOption::DENY);

    auto empty_config = load("{}");
    ASSERT_TRUE(empty_config.ok()) << empty_config.getErr();
    EXPECT_EQ(empty_config->getHstsMaxAgeSeconds(), 0);
}

TEST_F(HeaderSecurityConfigTest, loaded_negative_max_age_is_clamped)
{
    auto config = load("{ \"hstsMaxAgeSeconds\": -100 }");
    ASSERT_TRUE(config.ok()) << config.getErr();
    EXPECT_EQ(config->getHstsMaxAgeSeconds(), 0);
}

TEST_F(HeaderSecurityConfigTest, unknown_option_is_a_configuration_error)
{
    EXPECT_THAT(
        load("{ \"antiClickJackingOption\": \"ALLOW_FROM\" }"),
        IsError(
            "Invalid header security configuration. Error: Unknown X-Frame-Options value: \"ALLOW_FROM\""
        )
    );
}

TEST_F(HeaderSecurityConfigTest, wrong_value_types)
{
    EXPECT_THAT(
        load("{ \"hstsEnabled\": \"yes\" }"),
        IsError(StartsWith("Invalid header security configuration. Error: Illegal value for \"hstsEnabled\""))
    );
    EXPECT_THAT(
        load("{ \"hstsMaxAgeSeconds\": \"forever\" }"),
        IsError(HasSubstr("Illegal value for \"hstsMaxAgeSeconds\""))
    );
    EXPECT_THAT(
        load("{ \"antiClickJackingOption\": 1 }"),
        IsError(HasSubstr("Illegal value for \"antiClickJackingOption\""))
    );
}

TEST_F(HeaderSecurityConfigTest, missing_section)
{
    stringstream config_stream("{\"somethingElse\": {}}");
    EXPECT_THAT(
        loadHeaderSecurityConfig(config_stream),
        IsError(StartsWith("Failed to parse header security configuration. Error: "))
    );
}

TEST_F(HeaderSecurityConfigTest, malformed_json)
{
    stringstream config_stream("{\"headerSecurity\": {\"hstsEnabled\": tru");
    EXPECT_THAT(loadHeaderSecurityConfig(config_stream), IsError(_));
}

TEST_F(HeaderSecurityConfigTest, printing)
{
    HeaderSecurityConfig config;
    config.setHstsMaxAgeSeconds(60);
    config.setAntiClickJackingOption(FrameOption::ALLOW_FROM);
    config.setAntiClickJackingUri("https://example.com");

    stringstream os;
    os << config;
    EXPECT_EQ(
        os.str(),
        "{hstsEnabled: true, hstsMaxAgeSeconds: 60, hstsIncludeSubDomains: false, "
        "antiClickJackingEnabled: true, antiClickJackingOption: ALLOW-FROM, antiClickJackingUri: https://example.com}"
    );
}
