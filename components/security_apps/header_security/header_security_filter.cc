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

#include "header_security_filter.h"

#include "uri.h"
#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_HEADER_SECURITY);

const string HeaderSecurityFilter::hsts_header_name = "Strict-Transport-Security";
const string HeaderSecurityFilter::anti_click_jacking_header_name = "X-Frame-Options";

class HeaderSecurityFilter::Impl
{
public:
    void
    setConfiguration(const HeaderSecurityConfig &_config)
    {
        if (is_initialized) {
            throw FilterLifecycleException("Cannot change the header security configuration after initialization");
        }
        config = _config;
    }

    const HeaderSecurityConfig & getConfiguration() const { return config; }

    void
    init()
    {
        if (is_initialized) throw FilterLifecycleException("Header security filter is already initialized");

        string anti_click_jacking_value = buildAntiClickJackingHeaderValue();
        hsts_header_value = buildHstsHeaderValue();
        anti_click_jacking_header_value = move(anti_click_jacking_value);
        is_initialized = true;

        dbgInfo(D_HEADER_SECURITY)
            << "Header security filter initialized. "
            << hsts_header_name
            << ": "
            << (config.isHstsEnabled() ? hsts_header_value : "disabled")
            << ", "
            << anti_click_jacking_header_name
            << ": "
            << (config.isAntiClickJackingEnabled() ? anti_click_jacking_header_value : "disabled");
    }

    void
    fini()
    {
        is_initialized = false;
        hsts_header_value.clear();
        anti_click_jacking_header_value.clear();
    }

    void
    doFilter(I_FilterRequest &request, I_FilterResponse &response, I_FilterChain &chain) const
    {
        if (!is_initialized) {
            throw FilterLifecycleException("Header security filter was invoked before initialization");
        }
        if (response.isCommitted()) {
            dbgWarning(D_HEADER_SECURITY) << "Response was committed before the header security filter ran";
            throw FilterLifecycleException("Unable to add HTTP headers since response is already committed");
        }

        bool supports_headers = response.supportsHeaders();
        if (!supports_headers) dbgTrace(D_HEADER_SECURITY) << "Response has no HTTP headers, nothing to add";

        if (config.isHstsEnabled() && supports_headers && request.isSecure()) {
            dbgTrace(D_HEADER_SECURITY) << "Adding " << hsts_header_name << ": " << hsts_header_value;
            response.addHeader(hsts_header_name, hsts_header_value);
        }

        if (config.isAntiClickJackingEnabled() && supports_headers) {
            dbgTrace(D_HEADER_SECURITY)
                << "Adding "
                << anti_click_jacking_header_name
                << ": "
                << anti_click_jacking_header_value;
            response.addHeader(anti_click_jacking_header_name, anti_click_jacking_header_value);
        }

        chain.doFilter(request, response);
    }

    const string & getHstsHeaderValue() const { return hsts_header_value; }
    const string & getAntiClickJackingHeaderValue() const { return anti_click_jacking_header_value; }

private:
    string
    buildHstsHeaderValue() const
    {
        string value = "max-age=" + to_string(config.getHstsMaxAgeSeconds());
        if (config.isHstsIncludeSubDomains()) value += ";includeSubDomains";
        return value;
    }

    string
    buildAntiClickJackingHeaderValue() const
    {
        string value = config.getAntiClickJackingOptionToken();
        if (config.getAntiClickJackingOption() != FrameOption::ALLOW_FROM) return value;

        if (config.getAntiClickJackingUri().empty()) {
            throw HeaderSecurityConfigException(
                "antiClickJackingUri must be set when antiClickJackingOption is " + value
            );
        }
        Uri uri = Uri::parse(config.getAntiClickJackingUri()).unpack<HeaderSecurityConfigException>(
            "Illegal antiClickJackingUri. Error: "
        );
        return value + ":" + uri.toString();
    }

    HeaderSecurityConfig config;
    bool is_initialized = false;
    string hsts_header_value;
    string anti_click_jacking_header_value;
};

HeaderSecurityFilter::HeaderSecurityFilter() : Component("HeaderSecurityFilter"), pimpl(make_unique<Impl>()) {}

HeaderSecurityFilter::~HeaderSecurityFilter() {}

void
HeaderSecurityFilter::setConfiguration(const HeaderSecurityConfig &config)
{
    pimpl->setConfiguration(config);
}

const HeaderSecurityConfig &
HeaderSecurityFilter::getConfiguration() const
{
    return pimpl->getConfiguration();
}

void
HeaderSecurityFilter::init()
{
    pimpl->init();
}

void
HeaderSecurityFilter::init(const HeaderSecurityConfig &config)
{
    pimpl->setConfiguration(config);
    pimpl->init();
}

void
HeaderSecurityFilter::fini()
{
    pimpl->fini();
}

void
HeaderSecurityFilter::doFilter(I_FilterRequest &request, I_FilterResponse &response, I_FilterChain &chain) const
{
    pimpl->doFilter(request, response, chain);
}

const string &
HeaderSecurityFilter::getHstsHeaderValue() const
{
    return pimpl->getHstsHeaderValue();
}

const string &
HeaderSecurityFilter::getAntiClickJackingHeaderValue() const
{
    return pimpl->getAntiClickJackingHeaderValue();
}
