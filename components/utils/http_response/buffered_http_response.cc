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

#include "buffered_http_response.h"

#include <sstream>
#include <boost/algorithm/string/predicate.hpp>

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_HTTP_RESPONSE);

void
BufferedHttpResponse::addHeader(const string &name, const string &value)
{
    if (is_committed) {
        throw FilterLifecycleException("Cannot add header \"" + name + "\" to a committed response");
    }
    if (!supportsHeaders()) {
        throw FilterLifecycleException("Cannot add header \"" + name + "\" to a response without HTTP headers");
    }

    dbgTrace(D_HTTP_RESPONSE) << "Adding header. Name: " << name << ", value: " << value;
    headers.emplace_back(name, value);
}

void
BufferedHttpResponse::commit()
{
    dbgDebug(D_HTTP_RESPONSE) << "Committing response with " << headers.size() << " headers";
    is_committed = true;
}

vector<string>
BufferedHttpResponse::getHeaders(const string &name) const
{
    vector<string> values;
    for (const auto &header : headers) {
        if (boost::algorithm::iequals(header.first, name)) values.push_back(header.second);
    }
    return values;
}

string
BufferedHttpResponse::serializeHeaders() const
{
    stringstream serialized;
    for (const auto &header : headers) {
        serialized << header.first << ": " << header.second << "\r\n";
    }
    return serialized.str();
}
