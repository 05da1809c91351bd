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

#include "header_security_config.h"

#include "cereal/archives/json.hpp"
#include "cereal/types/string.hpp"

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_CONFIG);

template <typename T>
static bool
loadOptionalField(cereal::JSONInputArchive &ar, const string &name, T &value)
{
    try {
        ar(cereal::make_nvp(name, value));
        return true;
    } catch (const cereal::RapidJSONException &e) {
        throw HeaderSecurityConfigException("Illegal value for \"" + name + "\": " + e.what());
    } catch (const cereal::Exception &) {
        dbgTrace(D_CONFIG) << name << " is not configured, keeping the default";
        ar.setNextName(nullptr);
        return false;
    }
}

void
HeaderSecurityConfig::load(cereal::JSONInputArchive &ar)
{
    loadOptionalField(ar, "hstsEnabled", hsts_enabled);

    int max_age_seconds = 0;
    if (loadOptionalField(ar, "hstsMaxAgeSeconds", max_age_seconds)) setHstsMaxAgeSeconds(max_age_seconds);

    loadOptionalField(ar, "hstsIncludeSubDomains", hsts_include_sub_domains);
    loadOptionalField(ar, "antiClickJackingEnabled", anti_click_jacking_enabled);

    string option_token;
    if (loadOptionalField(ar, "antiClickJackingOption", option_token)) setAntiClickJackingOption(option_token);

    loadOptionalField(ar, "antiClickJackingUri", anti_click_jacking_uri);

    dbgDebug(D_CONFIG) << "Loaded header security configuration: " << *this;
}

void
HeaderSecurityConfig::setHstsMaxAgeSeconds(int max_age_seconds)
{
    if (max_age_seconds < 0) {
        dbgWarning(D_CONFIG) << "Negative HSTS max-age " << max_age_seconds << " was clamped to 0";
        max_age_seconds = 0;
    }
    hsts_max_age_seconds = max_age_seconds;
}

const string &
HeaderSecurityConfig::getAntiClickJackingOptionToken() const
{
    return getFrameOptionToken(anti_click_jacking_option);
}

void
HeaderSecurityConfig::setAntiClickJackingOption(const string &token)
{
    anti_click_jacking_option = parseFrameOption(token).unpack<HeaderSecurityConfigException>();
}

ostream &
HeaderSecurityConfig::print(ostream &os) const
{
    os
        << "{hstsEnabled: " << (hsts_enabled ? "true" : "false")
        << ", hstsMaxAgeSeconds: " << hsts_max_age_seconds
        << ", hstsIncludeSubDomains: " << (hsts_include_sub_domains ? "true" : "false")
        << ", antiClickJackingEnabled: " << (anti_click_jacking_enabled ? "true" : "false")
        << ", antiClickJackingOption: " << anti_click_jacking_option;
    if (!anti_click_jacking_uri.empty()) os << ", antiClickJackingUri: " << anti_click_jacking_uri;
    return os << "}";
}

ostream &
operator<<(ostream &os, const HeaderSecurityConfig &config)
{
    return config.print(os);
}

Maybe<HeaderSecurityConfig>
loadHeaderSecurityConfig(istream &input)
{
    HeaderSecurityConfig config;
    try {
        cereal::JSONInputArchive ar(input);
        ar(cereal::make_nvp("headerSecurity", config));
    } catch (const HeaderSecurityConfigException &e) {
        return genError("Invalid header security configuration. Error: " + e.getError());
    } catch (const cereal::Exception &e) {
        return genError(string("Failed to parse header security configuration. Error: ") + e.what());
    }
    return config;
}
