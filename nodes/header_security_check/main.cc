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

#include <iostream>
#include <fstream>
#include <getopt.h>

#include "cereal/archives/json.hpp"

#include "debug.h"
#include "header_security_filter.h"
#include "buffered_http_response.h"

using namespace std;

USE_DEBUG_FLAG(D_HEADER_SECURITY);

class CheckRequest : public I_FilterRequest
{
public:
    CheckRequest(bool _is_secure) : is_secure(_is_secure) {}

    bool isSecure() const override { return is_secure; }

private:
    bool is_secure;
};

// Last stage of the pipeline: hands the response to the client.
class CommitResponseStage : public I_FilterChain
{
public:
    void
    doFilter(I_FilterRequest &, I_FilterResponse &response) override
    {
        dbgTrace(D_HEADER_SECURITY) << "Reached the end of the filter chain";
        BufferedHttpResponse *buffered_response = dynamic_cast<BufferedHttpResponse *>(&response);
        if (buffered_response != nullptr) buffered_response->commit();
    }
};

class DebugSettings
{
public:
    void load(cereal::JSONInputArchive &ar) { Debug::loadConfiguration(ar); }
};

void
printUsage(const char *prog_name)
{
    cout << "Usage: " << prog_name << " [-s] [-v] [-d /path/to/debug.json] /path/to/config.json" << '\n';
    cout << "  -s, --secure        Treat the checked request as received over TLS" << '\n';
    cout << "  -d, --debug-config  Load debug streams and levels from a JSON file" << '\n';
    cout << "  -v                  Print trace output of the filter to stderr" << '\n';
    cout << "  -h                  Print this help message" << '\n';
}

static bool
loadDebugConfiguration(const string &debug_config_file)
{
    ifstream debug_config_stream(debug_config_file);
    if (!debug_config_stream.is_open()) {
        cerr << "Could not open debug configuration file: " << debug_config_file << '\n';
        return false;
    }

    try {
        cereal::JSONInputArchive ar(debug_config_stream);
        DebugSettings settings;
        ar(cereal::make_nvp("Debug", settings));
    } catch (const DebugConfigException &e) {
        cerr << "Invalid debug configuration: " << e.getError() << '\n';
        return false;
    } catch (const cereal::Exception &e) {
        cerr << "Failed to parse debug configuration file: " << debug_config_file << ", error: " << e.what() << '\n';
        return false;
    }
    return true;
}

int
main(int argc, char *argv[])
{
    bool is_secure = false;
    bool is_verbose = false;
    string debug_config_file;
    int opt;

    static struct option long_options[] = {
        {"secure", no_argument, 0, 's'},
        {"debug-config", required_argument, 0, 'd'},
        {0, 0, 0, 0}
    };

    while ((opt = getopt_long(argc, argv, "svhd:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 's':
                is_secure = true;
                break;
            case 'd':
                debug_config_file = optarg;
                break;
            case 'v':
                is_verbose = true;
                break;
            case 'h':
                printUsage(argv[0]);
                return 0;
            default:
                printUsage(argv[0]);
                return 1;
        }
    }

    if (optind != argc - 1) {
        cerr << "Error: exactly one configuration file is expected" << '\n';
        printUsage(argv[0]);
        return 1;
    }
    string config_file = argv[optind];

    // Debug output goes to stderr, stdout only carries the headers.
    Debug::setNewDefaultStdout(&cerr);
    if (!debug_config_file.empty() && !loadDebugConfiguration(debug_config_file)) return 1;
    // Loading a debug configuration replaces all levels, so -v is applied on top of it.
    if (is_verbose) Debug::setUnitTestFlag(D_HEADER_SECURITY, Debug::DebugLevel::TRACE);

    ifstream config_stream(config_file);
    if (!config_stream.is_open()) {
        cerr << "Could not open configuration file: " << config_file << '\n';
        return 1;
    }

    auto maybe_config = loadHeaderSecurityConfig(config_stream);
    if (!maybe_config.ok()) {
        cerr << maybe_config.getErr() << '\n';
        return 1;
    }

    HeaderSecurityFilter filter;
    try {
        filter.init(maybe_config.unpack());
    } catch (const HeaderSecurityConfigException &e) {
        cerr << "Header security filter failed to start: " << e.getError() << '\n';
        return 1;
    }

    CheckRequest request(is_secure);
    BufferedHttpResponse response;
    CommitResponseStage last_stage;
    try {
        filter.doFilter(request, response, last_stage);
    } catch (const FilterLifecycleException &e) {
        cerr << "Header security filter failed: " << e.getError() << '\n';
        return 1;
    }

    cout << response.serializeHeaders();
    return 0;
}
