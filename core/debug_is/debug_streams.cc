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

#include "debug_ex.h"

#include <iostream>
#include <map>
#include <sstream>

using namespace std;

static const int minimal_location_info_length = 60;

static const map<Debug::DebugLevel, string> prompt = {
    { Debug::DebugLevel::NOISE,     "***" },
    { Debug::DebugLevel::TRACE,     ">>>" },
    { Debug::DebugLevel::DEBUG,     "@@@" },
    { Debug::DebugLevel::WARNING,   "###" },
    { Debug::DebugLevel::INFO,      "---" },
    { Debug::DebugLevel::ERROR,     "!!!" },
    { Debug::DebugLevel::ASSERTION, "~~~" }
};

void
Debug::DebugStream::printHeader(
    DebugLevel curr_level,
    const string &file_name,
    const string &func_name,
    uint line)
{
    stringstream os;
    os << func_name << '@' << file_name << ':' << line;
    stringstream location;
    location.width(minimal_location_info_length);
    location << left << os.str() <<  " | ";
    (*getStream()) << "[" << location.str() << prompt.at(curr_level) << "] ";
}

DebugFileStream::DebugFileStream(const string &_file_name)
        :
    Debug::DebugStream(&file),
    file_name(_file_name)
{
    openDebugFile();
}

DebugFileStream::~DebugFileStream() { closeDebugFile(); }

void
DebugFileStream::finishMessage()
{
    file << endl;
    if (file.good()) return;

    cerr
        << "Failed to write debug message to file, re-opening debug file and retrying to write. File path: "
        << file_name
        << endl;

    static const uint32_t max_num_retries = 3;
    for (uint32_t num_retries = 0; num_retries < max_num_retries; num_retries++) {
        closeDebugFile();
        openDebugFile();
        file << endl;

        if (file.good()) return;
    }
}

void
DebugFileStream::openDebugFile()
{
    file.open(file_name, ofstream::app);
    if (!file.good()) {
        cerr << "Failed to open debug file. File path: " << file_name << endl;
    }
}

void
DebugFileStream::closeDebugFile()
{
    file.close();
    if (file.is_open()) {
        cerr << "Failed in closing debug file. File path: " << file_name << endl;
    }
}
