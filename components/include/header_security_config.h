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

#ifndef __HEADER_SECURITY_CONFIG_H__
#define __HEADER_SECURITY_CONFIG_H__

#include <string>
#include <istream>
#include <ostream>

#include "frame_option.h"
#include "maybe_res.h"

namespace cereal { class JSONInputArchive; }

class HeaderSecurityConfigException
{
public:
    HeaderSecurityConfigException(const std::string &_str) : str(_str) {}
    const std::string & getError() const { return str; }

private:
    std::string str;
};

class HeaderSecurityConfig
{
public:
    // Every key is optional, absent keys keep their defaults.
    // Throws HeaderSecurityConfigException when a present key holds an illegal value.
    void load(cereal::JSONInputArchive &ar);

    bool isHstsEnabled() const { return hsts_enabled; }
    void setHstsEnabled(bool enabled) { hsts_enabled = enabled; }

    int getHstsMaxAgeSeconds() const { return hsts_max_age_seconds; }
    // Negative values are clamped to 0.
    void setHstsMaxAgeSeconds(int max_age_seconds);

    bool isHstsIncludeSubDomains() const { return hsts_include_sub_domains; }
    void setHstsIncludeSubDomains(bool include_sub_domains) { hsts_include_sub_domains = include_sub_domains; }

    bool isAntiClickJackingEnabled() const { return anti_click_jacking_enabled; }
    void setAntiClickJackingEnabled(bool enabled) { anti_click_jacking_enabled = enabled; }

    FrameOption getAntiClickJackingOption() const { return anti_click_jacking_option; }
    const std::string & getAntiClickJackingOptionToken() const;
    void setAntiClickJackingOption(FrameOption option) { anti_click_jacking_option = option; }
    // Throws HeaderSecurityConfigException if `token` is not one of DENY, SAMEORIGIN or ALLOW-FROM.
    void setAntiClickJackingOption(const std::string &token);

    // Kept as given, it is parsed when the filter is initialized with ALLOW-FROM.
    const std::string & getAntiClickJackingUri() const { return anti_click_jacking_uri; }
    void setAntiClickJackingUri(const std::string &uri) { anti_click_jacking_uri = uri; }

    std::ostream & print(std::ostream &os) const;

private:
    bool hsts_enabled = true;
    int hsts_max_age_seconds = 0;
    bool hsts_include_sub_domains = false;
    bool anti_click_jacking_enabled = true;
    FrameOption anti_click_jacking_option = FrameOption::DENY;
    std::string anti_click_jacking_uri;
};

std::ostream & operator<<(std::ostream &os, const HeaderSecurityConfig &config);

// Reads a JSON document of the form {"headerSecurity": {...}}.
Maybe<HeaderSecurityConfig> loadHeaderSecurityConfig(std::istream &input);

#endif // __HEADER_SECURITY_CONFIG_H__
