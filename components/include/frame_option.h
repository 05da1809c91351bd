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

#ifndef __FRAME_OPTION_H__
#define __FRAME_OPTION_H__

#include <string>
#include <ostream>

#include "maybe_res.h"

// Framing policy carried by the X-Frame-Options header.
enum class FrameOption
{
    DENY,
    SAME_ORIGIN,
    ALLOW_FROM
};

// Wire token of the option: "DENY", "SAMEORIGIN" or "ALLOW-FROM".
const std::string & getFrameOptionToken(FrameOption option);

// Case-insensitive match against the wire tokens.
Maybe<FrameOption> parseFrameOption(const std::string &token);

std::ostream & operator<<(std::ostream &os, const FrameOption &option);

#endif // __FRAME_OPTION_H__
