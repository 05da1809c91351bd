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
#include <array>
#include <vector>
#include <algorithm>
#include <cstdlib>
#include <mutex>

#include "cereal/archives/json.hpp"
#include "cereal/types/vector.hpp"

using namespace std;

static constexpr Debug::DebugLevel default_level = Debug::DebugLevel::INFO;

class FlagsArray
{
public:
    FlagsArray() { fill(default_level); }

    void fill(Debug::DebugLevel level) { levels.fill(level); }

    Debug::DebugLevel & operator[](Debug::DebugFlags flag) { return levels[static_cast<size_t>(flag)]; }
    const Debug::DebugLevel & operator[](Debug::DebugFlags flag) const { return levels[static_cast<size_t>(flag)]; }

    array<Debug::DebugLevel, static_cast<size_t>(Debug::DebugFlags::COUNT)>::const_iterator
    begin() const
    {
        return levels.begin();
    }

    array<Debug::DebugLevel, static_cast<size_t>(Debug::DebugFlags::COUNT)>::const_iterator
    end() const
    {
        return levels.end();
    }

private:
    array<Debug::DebugLevel, static_cast<size_t>(Debug::DebugFlags::COUNT)> levels;
};

extern const Debug::DebugFlags D_ALL = Debug::DebugFlags::D_ALL;

#define DEFINE_FLAG(flag_name, parent_name) \
extern const Debug::DebugFlags flag_name = Debug::DebugFlags::flag_name;
#include "debug_flags.h"
#undef DEFINE_FLAG

static const multimap<Debug::DebugFlags, Debug::DebugFlags> flags_hierarchy = {

#define DEFINE_FLAG(flag_name, parent_name) \
    { Debug::DebugFlags::parent_name, Debug::DebugFlags::flag_name },
#include "debug_flags.h"
#undef DEFINE_FLAG

};

static map<string, shared_ptr<Debug::DebugStream>> active_streams = {
    { "STDOUT", make_shared<Debug::DebugStream>(&cout) }
};

static FlagsArray global_flags_levels;
static mutex streams_lock;

class DebugStreamConfiguration
{
public:
    DebugStreamConfiguration(const string &_stream_name) : stream_name(_stream_name) {}

    DebugStreamConfiguration() : DebugStreamConfiguration("STDOUT") {}

    void
    load(cereal::JSONInputArchive &ar)
    {
        try {
            ar(cereal::make_nvp("Output", stream_name));
        } catch (cereal::Exception &) {
            ar.setNextName(nullptr);
        }
        if (stream_name.empty()) stream_name = "STDOUT";
        if (stream_name != "STDOUT" && Debug::findDebugFilePrefix(stream_name).empty()) {
            throw DebugConfigException("Illegal debug stream name: " + stream_name);
        }

#define DEFINE_FLAG(flag_name, parent_name)                                                              \
        try {                                                                                            \
            string level;                                                                                \
            ar(cereal::make_nvp(#flag_name, level));                                                     \
            assignValueToFlagRecursively(flag_values, Debug::DebugFlags::flag_name, turnToLevel(level)); \
        } catch (cereal::Exception &) {                                                                  \
            ar.setNextName(nullptr);                                                                     \
        }
DEFINE_FLAG(D_ALL, D_ALL)
#include "debug_flags.h"
#undef DEFINE_FLAG
    }

    static void
    assignValueToFlagRecursively(FlagsArray &flag_levels, Debug::DebugFlags flag, Debug::DebugLevel level)
    {
        flag_levels[flag] = level;
        auto sub_flags_range = flags_hierarchy.equal_range(flag);
        for (auto flag_iterator = sub_flags_range.first; flag_iterator != sub_flags_range.second; flag_iterator++) {
            assignValueToFlagRecursively(flag_levels, flag_iterator->second, level);
        }
    }

    FlagsArray flag_values;
    string stream_name;

private:
    Debug::DebugLevel
    turnToLevel(const string &level)
    {
        if (level == "Error")   return Debug::DebugLevel::ERROR;
        if (level == "Warning") return Debug::DebugLevel::WARNING;
        if (level == "Info")    return Debug::DebugLevel::INFO;
        if (level == "Debug")   return Debug::DebugLevel::DEBUG;
        if (level == "Trace")   return Debug::DebugLevel::TRACE;
        if (level == "None")    return Debug::DebugLevel::NONE;

        throw DebugConfigException("Illegal debug flag level: " + level);
    }
};

class DebugConfiguration
{
public:
    DebugConfiguration()
    {
        streams_in_context.push_back(DebugStreamConfiguration());
    }

    void
    load(cereal::JSONInputArchive &ar)
    {
        streams_in_context.clear();
        ar(cereal::make_nvp("Streams", streams_in_context));
    }

    vector<DebugStreamConfiguration> streams_in_context;
};

static DebugConfiguration current_config;

static void
recalculateGlobalLevels()
{
    global_flags_levels.fill(Debug::DebugLevel::NONE);
    for (const DebugStreamConfiguration &stream : current_config.streams_in_context) {
        for (size_t flag = 0; flag < static_cast<size_t>(Debug::DebugFlags::COUNT); flag++) {
            auto flag_enum = static_cast<Debug::DebugFlags>(flag);
            global_flags_levels[flag_enum] = min(global_flags_levels[flag_enum], stream.flag_values[flag_enum]);
        }
    }
}

// LCOV_EXCL_START - function is covered in unit-test, but not detected bt gcov
Debug::Debug(
    const string &_file_name,
    const string &_func_name,
    const uint &_line)
        :
    do_assert(true),
    level(DebugLevel::ASSERTION),
    file_name(_file_name),
    func_name(_func_name),
    line(_line)
{
    for (auto &stream : current_config.streams_in_context) {
        addActiveStream(stream.stream_name);
    }
}
// LCOV_EXCL_STOP

Debug::Debug(
    const string &_file_name,
    const string &_func_name,
    const uint &_line,
    const DebugLevel &_level,
    const DebugFlags &flag1)
        :
    do_assert(false),
    level(_level),
    file_name(_file_name),
    func_name(_func_name),
    line(_line)
{
    for (auto &stream : current_config.streams_in_context) {
        if (stream.flag_values[flag1] <= level) addActiveStream(stream.stream_name);
    }
}

Debug::Debug(
    const string &_file_name,
    const string &_func_name,
    const uint &_line,
    const DebugLevel &_level,
    const DebugFlags &flag1,
    const DebugFlags &flag2)
        :
    do_assert(false),
    level(_level),
    file_name(_file_name),
    func_name(_func_name),
    line(_line)
{
    for (auto &stream : current_config.streams_in_context) {
        if (stream.flag_values[flag1] <= level || stream.flag_values[flag2] <= level) {
            addActiveStream(stream.stream_name);
        }
    }
}

Debug::~Debug()
{
    if (do_assert) stream << "\nPanic!";

    string message = stream.getMessage();
    {
        // Streams are shared by every thread that logs, a message is written as one unit.
        lock_guard<mutex> guard(streams_lock);
        for (auto &added_stream : current_active_streams) {
            added_stream->printHeader(level, file_name, func_name, line);
            *added_stream->getStream() << message;
            added_stream->finishMessage();
        }
    }

    if (do_assert) abort();
}

void
Debug::loadConfiguration(cereal::JSONInputArchive &ar)
{
    DebugConfiguration new_config;
    new_config.load(ar);
    if (new_config.streams_in_context.empty()) new_config.streams_in_context.push_back(DebugStreamConfiguration());

    map<string, shared_ptr<DebugStream>> new_streams = { { "STDOUT", active_streams["STDOUT"] } };
    for (const DebugStreamConfiguration &stream : new_config.streams_in_context) {
        if (new_streams.count(stream.stream_name) > 0) continue;
        auto existing_stream = active_streams.find(stream.stream_name);
        if (existing_stream != active_streams.end()) {
            new_streams[stream.stream_name] = existing_stream->second;
            continue;
        }
        new_streams[stream.stream_name] = make_shared<DebugFileStream>(stream.stream_name);
    }

    active_streams = move(new_streams);
    current_config = move(new_config);
    recalculateGlobalLevels();
    lowest_global_level = *min_element(global_flags_levels.begin(), global_flags_levels.end());
}

void
Debug::resetConfiguration()
{
    current_config = DebugConfiguration();
    for (auto stream = active_streams.begin(); stream != active_streams.end();) {
        if (stream->first == "STDOUT") {
            stream++;
        } else {
            stream = active_streams.erase(stream);
        }
    }
    global_flags_levels.fill(default_level);
    lowest_global_level = default_level;
}

bool
Debug::evalFlagByFlag(Debug::DebugLevel level, Debug::DebugFlags flag)
{
    return global_flags_levels[flag] <= level;
}

void
Debug::setNewDefaultStdout(ostream *new_stream)
{
    active_streams["STDOUT"] = make_shared<Debug::DebugStream>(new_stream);
}

bool
Debug::isFlagAtleastLevel(Debug::DebugFlags flag, Debug::DebugLevel level)
{
    return global_flags_levels[flag] <= level;
}

void
Debug::setUnitTestFlag(Debug::DebugFlags flag, Debug::DebugLevel level)
{
    if (lowest_global_level > level) lowest_global_level = level;
    global_flags_levels[flag] = level;
    bool has_stdout = false;
    for (DebugStreamConfiguration &stream : current_config.streams_in_context) {
        if (stream.stream_name != "STDOUT") continue;
        stream.flag_values[flag] = level;
        has_stdout = true;
    }
    if (has_stdout) return;

    DebugStreamConfiguration stdout_stream;
    stdout_stream.flag_values.fill(DebugLevel::NONE);
    stdout_stream.flag_values[flag] = level;
    current_config.streams_in_context.push_back(stdout_stream);
}

string
Debug::findDebugFilePrefix(const string &file_name)
{
    static const vector<string> allowed_debug_file_prefixes({ "/tmp/", "/var/log/" });
    for (const string &single_prefix : allowed_debug_file_prefixes) {
        if (file_name.find(single_prefix) != 0) continue;

        auto file_name_begins = file_name.begin() + single_prefix.size();
        if (file_name_begins == file_name.end()) return "";
        int num_forbidden_chars = count_if(
            file_name_begins,
            file_name.end(),
            [] (unsigned char c) { return !isalnum(c) && c != '/' && c != '_' && c != '-' && c != '.'; }
        );
        return num_forbidden_chars > 0 ? "" : single_prefix;
    }

    return "";
}

void
Debug::addActiveStream(const string &name)
{
    auto stream_entry = active_streams.find(name);
    if (stream_entry != active_streams.end()) {
        current_active_streams.insert(stream_entry->second);
    }
}

Debug::DebugLevel Debug::lowest_global_level = default_level;
