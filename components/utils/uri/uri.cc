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

#include "uri.h"

#include <boost/regex.hpp>

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_URI);

// RFC 3986, appendix B.
static const boost::regex uri_reference_regex("^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\\?([^#]*))?(#(.*))?$");

static const boost::regex scheme_regex("[A-Za-z][A-Za-z0-9+.-]*");
static const boost::regex authority_regex("(?:[A-Za-z0-9._~!$&'()*+,;=:@\\[\\]-]|%[0-9A-Fa-f]{2})*");
static const boost::regex path_regex("(?:[A-Za-z0-9._~!$&'()*+,;=:@/-]|%[0-9A-Fa-f]{2})*");
static const boost::regex query_regex("(?:[A-Za-z0-9._~!$&'()*+,;=:@/?-]|%[0-9A-Fa-f]{2})*");

static Maybe<void>
validateComponent(const string &component_name, const string &value, const boost::regex &allowed)
{
    if (boost::regex_match(value, allowed)) return Maybe<void>();
    return genError("Illegal character in " + component_name + ": \"" + value + "\"");
}

Maybe<Uri>
Uri::parse(const string &uri)
{
    if (uri.empty()) return genError("URI is empty");

    boost::smatch parts;
    if (!boost::regex_match(uri, parts, uri_reference_regex)) {
        return genError("Malformed URI: \"" + uri + "\"");
    }

    Uri result;
    result.raw = uri;
    result.scheme = parts[2].str();
    result.authority = parts[4].str();
    result.path = parts[5].str();
    result.query = parts[7].str();
    result.fragment = parts[9].str();

    bool has_scheme = parts[1].matched;
    bool has_authority = parts[3].matched;

    if (has_scheme) {
        auto scheme_validation = validateComponent("scheme name", result.scheme, scheme_regex);
        if (!scheme_validation.ok()) return scheme_validation.passErr();
        bool has_scheme_specific_part = has_authority || !result.path.empty() || parts[6].matched || parts[8].matched;
        if (!has_scheme_specific_part) return genError("Expected scheme-specific part in URI: \"" + uri + "\"");
    }

    if (has_authority && result.authority.empty() && result.path.empty()) {
        return genError("Expected authority in URI: \"" + uri + "\"");
    }

    auto authority_validation = validateComponent("authority", result.authority, authority_regex);
    if (!authority_validation.ok()) return authority_validation.passErr();

    auto path_validation = validateComponent("path", result.path, path_regex);
    if (!path_validation.ok()) return path_validation.passErr();

    auto query_validation = validateComponent("query", result.query, query_regex);
    if (!query_validation.ok()) return query_validation.passErr();

    auto fragment_validation = validateComponent("fragment", result.fragment, query_regex);
    if (!fragment_validation.ok()) return fragment_validation.passErr();

    dbgTrace(D_URI)
        << "Parsed URI: "
        << uri
        << ", scheme: "
        << result.scheme
        << ", authority: "
        << result.authority
        << ", path: "
        << result.path;

    return result;
}

ostream &
operator<<(ostream &os, const Uri &uri)
{
    return os << uri.toString();
}
