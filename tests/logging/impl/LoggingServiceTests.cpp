/**
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * logging/impl/LoggingServiceTests.cpp
 *
 * Unit tests for logging levels and the logging services.
 */

#include "LibraryConfig.h"
#include "logging/LoggingService.h"
#include "util/Misc.h"

#include <cstdio>
#include <stdexcept>
#include <boost/test/unit_test.hpp>

using namespace samlsp;
using namespace std;

#define DATA_PATH "./data/"
#define LOG_FILE "./samlsp-test.log"

struct Console_Fixture {
    Console_Fixture() : data_path(DATA_PATH) {
        LibraryConfig::getConfig().init((data_path + "console.ini").c_str(), true);
    }
    ~Console_Fixture() {
        LibraryConfig::getConfig().term();
    }
    string data_path;
};

struct File_Fixture {
    File_Fixture() : data_path(DATA_PATH) {
        remove(LOG_FILE);
        LibraryConfig::getConfig().init((data_path + "file-logging.ini").c_str(), true);
    }
    ~File_Fixture() {
        LibraryConfig::getConfig().term();
        remove(LOG_FILE);
    }
    string data_path;
};

BOOST_AUTO_TEST_CASE(Priority_names)
{
    BOOST_CHECK_EQUAL(Priority::getPriorityName(Priority::SAMLSP_CRIT), "CRIT");
    BOOST_CHECK_EQUAL(Priority::getPriorityName(Priority::SAMLSP_WARN), "WARN");
    BOOST_CHECK_EQUAL(Priority::getPriorityName(Priority::SAMLSP_DEBUG), "DEBUG");
    BOOST_CHECK_EQUAL(Priority::getPriorityName(150), "ERROR");
    BOOST_CHECK_EQUAL(Priority::getPriorityName(-1), "NOTSET");
    BOOST_CHECK_EQUAL(Priority::getPriorityName(1000), "NOTSET");
}

BOOST_AUTO_TEST_CASE(Priority_values)
{
    BOOST_CHECK_EQUAL(Priority::getPriorityValue("INFO"), Priority::SAMLSP_INFO);
    BOOST_CHECK_EQUAL(Priority::getPriorityValue(" warn "), Priority::SAMLSP_WARN);
    BOOST_CHECK_EQUAL(Priority::getPriorityValue("250"), 250);
    BOOST_CHECK_THROW(Priority::getPriorityValue("LOUD"), invalid_argument);
    BOOST_CHECK_THROW(Priority::getPriorityValue(""), invalid_argument);
}

BOOST_FIXTURE_TEST_CASE(ConsoleLoggingService_levels, Console_Fixture)
{
    Category& def = Category::getInstance(SAMLSP_LOGCAT ".Test");
    BOOST_CHECK_EQUAL(def.getName(), SAMLSP_LOGCAT ".Test");
    BOOST_CHECK_EQUAL(def.getPriority(), Priority::SAMLSP_WARN);
    BOOST_CHECK(def.isWarnEnabled());
    BOOST_CHECK(!def.isInfoEnabled());

    Category& config = Category::getInstance(SAMLSP_LOGCAT ".Config");
    BOOST_CHECK_EQUAL(config.getPriority(), Priority::SAMLSP_ERROR);
    BOOST_CHECK(!config.isWarnEnabled());

    // Same name, same object.
    BOOST_CHECK_EQUAL(&def, &Category::getInstance(SAMLSP_LOGCAT ".Test"));
}

BOOST_FIXTURE_TEST_CASE(FileLoggingService_output, File_Fixture)
{
    Category& log = Category::getInstance(SAMLSP_LOGCAT ".Test");
    BOOST_CHECK(log.isDebugEnabled());

    log.warn("metadata fetch from %s failed %d time(s)", "https://idp.example.org", 3);
    log.debug(string("preformatted message"));

    string content = FileSupport::read(LOG_FILE);
    BOOST_CHECK(content.find(" - WARN [" SAMLSP_LOGCAT ".Test] - metadata fetch from https://idp.example.org failed 3 time(s)") != string::npos);
    BOOST_CHECK(content.find(" - DEBUG [" SAMLSP_LOGCAT ".Test] - preformatted message") != string::npos);
}
