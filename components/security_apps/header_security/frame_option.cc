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

#include "frame_option.h"

#include <map>
#include <boost/algorithm/string/predicate.hpp>

using namespace std;

static const map<FrameOption, string> frame_option_tokens = {
    { FrameOption::DENY,        "DENY" },
    { FrameOption::SAME_ORIGIN, "SAMEORIGIN" },
    { FrameOption::ALLOW_FROM,  "ALLOW-FROM" }
};

const string &
getFrameOptionToken(FrameOption option)
{
    return frame_option_tokens.at(option);
}

Maybe<FrameOption>
parseFrameOption(const string &token)
{
    for (const auto &option : frame_option_tokens) {
        if (boost::algorithm::iequals(option.second, token)) return option.first;
    }
    return genError("Unknown X-Frame-Options value: \"" + token + "\"");
}

ostream &
operator<<(ostream &os, const FrameOption &option)
{
    return os << getFrameOptionToken(option);
}
