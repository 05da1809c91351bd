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

#ifndef __I_FILTER_RESPONSE_H__
#define __I_FILTER_RESPONSE_H__

#include <string>

class I_FilterResponse
{
public:
    // A committed response already sent its headers to the client and cannot take new ones.
    virtual bool isCommitted() const = 0;
    // False for responses of protocols without HTTP headers that travel on the same pipeline.
    virtual bool supportsHeaders() const = 0;
    // Appends a header line. Existing values of the same name are kept.
    virtual void addHeader(const std::string &name, const std::string &value) = 0;

protected:
    virtual ~I_FilterResponse() {}
};

#endif // __I_FILTER_RESPONSE_H__
