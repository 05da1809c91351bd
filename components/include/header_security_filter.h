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

#ifndef __HEADER_SECURITY_FILTER_H__
#define __HEADER_SECURITY_FILTER_H__

#include <memory>
#include <string>

#include "component.h"
#include "header_security_config.h"
#include "filter_lifecycle_exception.h"
#include "i_filter_chain.h"

// Adds the Strict-Transport-Security and X-Frame-Options response headers.
//
// The header values are compiled once by init() and only read afterwards, so a single initialized instance
// may serve any number of concurrent doFilter() calls.
class HeaderSecurityFilter : public Component
{
public:
    static const std::string hsts_header_name;
    static const std::string anti_click_jacking_header_name;

    HeaderSecurityFilter();
    ~HeaderSecurityFilter();

    // Only allowed before init().
    void setConfiguration(const HeaderSecurityConfig &config);
    const HeaderSecurityConfig & getConfiguration() const;

    // Throws HeaderSecurityConfigException on an invalid configuration and
    // FilterLifecycleException when already initialized.
    void init() override;
    void init(const HeaderSecurityConfig &config);
    void fini() override;

    bool isConfigProblemFatal() const override { return true; }

    // Throws FilterLifecycleException if the response is already committed or the filter is not initialized,
    // in which case `chain` is not invoked.
    void doFilter(I_FilterRequest &request, I_FilterResponse &response, I_FilterChain &chain) const;

    const std::string & getHstsHeaderValue() const;
    const std::string & getAntiClickJackingHeaderValue() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
};

#endif // __HEADER_SECURITY_FILTER_H__
