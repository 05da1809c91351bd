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

#ifndef __BUFFERED_HTTP_RESPONSE_H__
#define __BUFFERED_HTTP_RESPONSE_H__

#include <string>
#include <vector>
#include <utility>

#include "i_filter_response.h"
#include "filter_lifecycle_exception.h"

// Response that keeps its header lines in memory, in insertion order, until commit() hands them to the client.
class BufferedHttpResponse : public I_FilterResponse
{
public:
    enum class Protocol { HTTP, OTHER };

    BufferedHttpResponse() : BufferedHttpResponse(Protocol::HTTP) {}
    explicit BufferedHttpResponse(Protocol _protocol) : protocol(_protocol) {}

    bool isCommitted() const override { return is_committed; }
    bool supportsHeaders() const override { return protocol == Protocol::HTTP; }
    // Throws FilterLifecycleException once committed, or when the protocol has no headers.
    void addHeader(const std::string &name, const std::string &value) override;

    void commit();

    // All values of `name`, compared case-insensitively, in insertion order.
    std::vector<std::string> getHeaders(const std::string &name) const;
    size_t getHeaderCount() const { return headers.size(); }
    const std::vector<std::pair<std::string, std::string>> & getAllHeaders() const { return headers; }

    // "Name: value\r\n" per header line.
    std::string serializeHeaders() const;

private:
    Protocol protocol;
    bool is_committed = false;
    std::vector<std::pair<std::string, std::string>> headers;
};

#endif // __BUFFERED_HTTP_RESPONSE_H__
