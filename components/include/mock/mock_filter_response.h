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

#ifndef __MOCK_FILTER_RESPONSE_H__
#define __MOCK_FILTER_RESPONSE_H__

#include "i_filter_response.h"
#include "cptest.h"

class MockFilterResponse : public I_FilterResponse
{
public:
    MOCK_CONST_METHOD0(isCommitted, bool());
    MOCK_CONST_METHOD0(supportsHeaders, bool());
    MOCK_METHOD2(addHeader, void(const std::string &, const std::string &));
};

#endif // __MOCK_FILTER_RESPONSE_H__
