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

#ifndef __URI_H__
#define __URI_H__

#include <string>
#include <ostream>

#include "maybe_res.h"

// A syntactically valid RFC 3986 URI reference, absolute ("https://example.com/a") or relative ("/a?b").
// The components are split out for inspection, while toString() always returns the text as it was given.
class Uri
{
public:
    static Maybe<Uri> parse(const std::string &uri);

    const std::string & getScheme() const { return scheme; }
    const std::string & getAuthority() const { return authority; }
    const std::string & getPath() const { return path; }
    const std::string & getQuery() const { return query; }
    const std::string & getFragment() const { return fragment; }
    bool isAbsolute() const { return !scheme.empty(); }

    const std::string & toString() const { return raw; }

    bool operator==(const Uri &other) const { return raw == other.raw; }

private:
    Uri() {}

    std::string raw;
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
};

std::ostream & operator<<(std::ostream &os, const Uri &uri);

#endif // __URI_H__
