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

// No include guard: this file is expanded several times with different DEFINE_FLAG definitions.
#ifndef DEFINE_FLAG
#error "DEFINE_FLAG must be defined before including debug_flags.h"
#endif // DEFINE_FLAG

DEFINE_FLAG(D_INFRA, D_ALL)
    DEFINE_FLAG(D_CONFIG, D_INFRA)

DEFINE_FLAG(D_COMPONENT, D_ALL)
    DEFINE_FLAG(D_HEADER_SECURITY, D_COMPONENT)
    DEFINE_FLAG(D_HTTP_RESPONSE, D_COMPONENT)
    DEFINE_FLAG(D_URI, D_COMPONENT)
