#include "debug.h"

#include <sstream>
#include <string>
#include <fstream>
#include <iomanip>
#include <cstdio>
#include <unistd.h>
#include <thread>
#include <vector>

#include "cereal/archives/json.hpp"
#include "cptest.h"

using namespace std;
using namespace testing;

USE_DEBUG_FLAG(D_CONFIG);
USE_DEBUG_FLAG(D_HEADER_SECURITY);
USE_DEBUG_FLAG(D_URI);

string line = "";

void doConfigError() { dbgError(D_CONFIG) << "Config error message"; line = to_string(__LINE__); }
void doConfigWarning() { dbgWarning(D_CONFIG) << "Config warning message"; line = to_string(__LINE__); }
void doConfigInfo() { dbgInfo(D_CONFIG) << "Config info message"; line = to_string(__LINE__); }
void doConfigDebug() { dbgDebug(D_CONFIG) << "Config debug message"; line = to_string(__LINE__); }
void doConfigTrace() { dbgTrace(D_CONFIG) << "Config trace message"; line = to_string(__LINE__); }
void doHeaderTrace() { dbgTrace(D_HEADER_SECURITY) << "Header trace message"; line = to_string(__LINE__); }
void doUriTrace() { dbgTrace(D_URI) << "URI trace message"; line = to_string(__LINE__); }
void doTwoFlagsDebug() { dbgDebug(D_CONFIG, D_URI) << "Two flags message"; line = to_string(__LINE__); }

static string
expectedLine(const string &func, const string &prompt, const string &message)
{
    stringstream location;
    location << left << setw(60) << (func + "@debug_ut.cc:" + line) << " | ";
    return "[" + location.str() + prompt + "] " + message + "\n";
}

static void
loadDebugConfiguration(const string &json)
{
    stringstream json_stream(json);
    cereal::JSONInputArchive ar(json_stream);
    Debug::loadConfiguration(ar);
}

class DebugTest : public Test
{
public:
    DebugTest() { Debug::setNewDefaultStdout(&debug_output); }

    ~DebugTest()
    {
        Debug::resetConfiguration();
        Debug::setNewDefaultStdout(&cout);
    }

    stringstream debug_output;
};

TEST(DebugBaseTest, death_on_panic)
{
    cptestPrepareToDie();

    EXPECT_DEATH(dbgAssert(1==2) << "Does your school teach otherwise?", "Does your school teach otherwise?");
}

TEST_F(DebugTest, default_levels)
{
    doConfigError();
    EXPECT_EQ(debug_output.str(), expectedLine("doConfigError", "!!!", "Config error message"));
    debug_output.str("");

    doConfigInfo();
    EXPECT_EQ(debug_output.str(), expectedLine("doConfigInfo", "---", "Config info message"));
    debug_output.str("");

    doConfigWarning();
    EXPECT_EQ(debug_output.str(), expectedLine("doConfigWarning", "###", "Config warning message"));
    debug_output.str("");

    doConfigDebug();
    EXPECT_EQ(debug_output.str(), "");

    doConfigTrace();
    EXPECT_EQ(debug_output.str(), "");
}

TEST_F(DebugTest, unit_test_flag_affects_only_its_flag)
{
    Debug::setUnitTestFlag(D_URI, Debug::DebugLevel::TRACE);

    doUriTrace();
    EXPECT_EQ(debug_output.str(), expectedLine("doUriTrace", ">>>", "URI trace message"));
    debug_output.str("");

    doHeaderTrace();
    EXPECT_EQ(debug_output.str(), "");

    EXPECT_TRUE(Debug::isFlagAtleastLevel(D_URI, Debug::DebugLevel::TRACE));
    EXPECT_FALSE(Debug::isFlagAtleastLevel(D_HEADER_SECURITY, Debug::DebugLevel::TRACE));
}

TEST_F(DebugTest, message_is_printed_if_any_of_its_flags_is_on)
{
    doTwoFlagsDebug();
    EXPECT_EQ(debug_output.str(), "");

    Debug::setUnitTestFlag(D_URI, Debug::DebugLevel::DEBUG);
    doTwoFlagsDebug();
    EXPECT_EQ(debug_output.str(), expectedLine("doTwoFlagsDebug", "@@@", "Two flags message"));
}

TEST_F(DebugTest, configuration_applies_to_sub_flags)
{
    loadDebugConfiguration(
        "{"
        "    \"Streams\": ["
        "        {"
        "            \"Output\": \"STDOUT\","
        "            \"D_COMPONENT\": \"Trace\""
        "        }"
        "    ]"
        "}"
    );

    doHeaderTrace();
    EXPECT_EQ(debug_output.str(), expectedLine("doHeaderTrace", ">>>", "Header trace message"));
    debug_output.str("");

    doUriTrace();
    EXPECT_THAT(debug_output.str(), HasSubstr("URI trace message"));
    debug_output.str("");

    doConfigDebug();
    EXPECT_EQ(debug_output.str(), "");
}

TEST_F(DebugTest, specific_flag_overrides_all)
{
    loadDebugConfiguration(
        "{"
        "    \"Streams\": ["
        "        {"
        "            \"D_ALL\": \"Error\","
        "            \"D_CONFIG\": \"Debug\""
        "        }"
        "    ]"
        "}"
    );

    doConfigDebug();
    EXPECT_EQ(debug_output.str(), expectedLine("doConfigDebug", "@@@", "Config debug message"));
    debug_output.str("");

    doConfigTrace();
    EXPECT_EQ(debug_output.str(), "");

    doUriTrace();
    EXPECT_EQ(debug_output.str(), "");
}

TEST_F(DebugTest, unit_test_flag_applies_on_top_of_loaded_configuration)
{
    loadDebugConfiguration("{\"Streams\": [{\"Output\": \"STDOUT\", \"D_ALL\": \"Error\"}]}");
    Debug::setUnitTestFlag(D_HEADER_SECURITY, Debug::DebugLevel::TRACE);

    doHeaderTrace();
    EXPECT_EQ(debug_output.str(), expectedLine("doHeaderTrace", ">>>", "Header trace message"));
    debug_output.str("");

    doConfigInfo();
    EXPECT_EQ(debug_output.str(), "");
}

TEST_F(DebugTest, unit_test_flag_adds_stdout_when_only_files_are_configured)
{
    string file_name = "/tmp/header_security_debug_ut_stdout_" + to_string(getpid()) + ".dbg";
    loadDebugConfiguration(
        "{\"Streams\": [{\"Output\": \"" + file_name + "\", \"D_CONFIG\": \"Error\"}]}"
    );
    Debug::setUnitTestFlag(D_HEADER_SECURITY, Debug::DebugLevel::TRACE);

    doHeaderTrace();
    EXPECT_EQ(debug_output.str(), expectedLine("doHeaderTrace", ">>>", "Header trace message"));
    debug_output.str("");

    doUriTrace();
    EXPECT_EQ(debug_output.str(), "");

    Debug::resetConfiguration();
    remove(file_name.c_str());
}

TEST_F(DebugTest, reset_configuration_restores_defaults)
{
    loadDebugConfiguration("{\"Streams\": [{\"D_ALL\": \"Trace\"}]}");
    doConfigTrace();
    EXPECT_THAT(debug_output.str(), HasSubstr("Config trace message"));
    debug_output.str("");

    Debug::resetConfiguration();
    doConfigTrace();
    EXPECT_EQ(debug_output.str(), "");
    doConfigInfo();
    EXPECT_THAT(debug_output.str(), HasSubstr("Config info message"));
}

TEST_F(DebugTest, illegal_level_is_rejected)
{
    try {
        loadDebugConfiguration("{\"Streams\": [{\"D_CONFIG\": \"Verbose\"}]}");
        FAIL() << "Illegal level was accepted";
    } catch (const DebugConfigException &e) {
        EXPECT_EQ(e.getError(), "Illegal debug flag level: Verbose");
    }

    doConfigInfo();
    EXPECT_THAT(debug_output.str(), HasSubstr("Config info message"));
}

TEST_F(DebugTest, illegal_stream_name_is_rejected)
{
    EXPECT_THROW(
        loadDebugConfiguration("{\"Streams\": [{\"Output\": \"relative/debug.log\"}]}"),
        DebugConfigException
    );
    EXPECT_THROW(
        loadDebugConfiguration("{\"Streams\": [{\"Output\": \"/etc/debug.log\"}]}"),
        DebugConfigException
    );
    EXPECT_THROW(
        loadDebugConfiguration("{\"Streams\": [{\"Output\": \"/tmp/debug file.log\"}]}"),
        DebugConfigException
    );
}

TEST_F(DebugTest, missing_streams_is_a_parse_error)
{
    EXPECT_THROW(loadDebugConfiguration("{\"Output\": \"STDOUT\"}"), cereal::Exception);
}

TEST_F(DebugTest, debug_file_prefix)
{
    EXPECT_EQ(Debug::findDebugFilePrefix("/tmp/header_security.dbg"), "/tmp/");
    EXPECT_EQ(Debug::findDebugFilePrefix("/var/log/header_security/filter.dbg"), "/var/log/");
    EXPECT_EQ(Debug::findDebugFilePrefix("/tmp/"), "");
    EXPECT_EQ(Debug::findDebugFilePrefix("/home/user/filter.dbg"), "");
}

TEST_F(DebugTest, write_to_file_stream)
{
    string file_name = "/tmp/header_security_debug_ut_" + to_string(getpid()) + ".dbg";
    remove(file_name.c_str());

    loadDebugConfiguration(
        "{"
        "    \"Streams\": ["
        "        {"
        "            \"Output\": \"" + file_name + "\","
        "            \"D_CONFIG\": \"Trace\""
        "        }"
        "    ]"
        "}"
    );

    doConfigTrace();
    EXPECT_EQ(debug_output.str(), "");

    Debug::resetConfiguration();

    ifstream debug_file(file_name);
    ASSERT_TRUE(debug_file.is_open());
    stringstream file_content;
    file_content << debug_file.rdbuf();
    EXPECT_EQ(file_content.str(), expectedLine("doConfigTrace", ">>>", "Config trace message"));

    remove(file_name.c_str());
}

TEST_F(DebugTest, concurrent_messages_are_not_interleaved)
{
    string file_name = "/tmp/header_security_debug_ut_threads_" + to_string(getpid()) + ".dbg";
    remove(file_name.c_str());

    loadDebugConfiguration(
        "{"
        "    \"Streams\": ["
        "        {"
        "            \"Output\": \"" + file_name + "\","
        "            \"D_URI\": \"Trace\""
        "        }"
        "    ]"
        "}"
    );

    static const int num_threads = 8;
    static const int messages_per_thread = 250;
    vector<thread> workers;
    for (int thread_id = 0; thread_id < num_threads; thread_id++) {
        workers.emplace_back(
            [thread_id] ()
            {
                for (int i = 0; i < messages_per_thread; i++) {
                    dbgTrace(D_URI) << "thread " << thread_id << " message " << i << " end";
                }
            }
        );
    }
    for (auto &worker : workers) {
        worker.join();
    }

    Debug::resetConfiguration();

    ifstream debug_file(file_name);
    ASSERT_TRUE(debug_file.is_open());
    int num_lines = 0;
    string debug_line;
    while (getline(debug_file, debug_line)) {
        num_lines++;
        EXPECT_THAT(debug_line, StartsWith("["));
        EXPECT_THAT(debug_line, HasSubstr(" | >>>] thread "));
        EXPECT_THAT(debug_line, EndsWith(" end"));
    }
    EXPECT_EQ(num_lines, num_threads * messages_per_thread);

    remove(file_name.c_str());
}
