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
 * logging/impl/Priority.cpp
 *
 * Logging levels understood by the library.
 */

#include "internal.h"
#include "logging/Priority.h"

#include <cstdlib>
#include <stdexcept>
#include <boost/algorithm/string.hpp>

using namespace samlsp;
using namespace std;

namespace {
    const string g_levelNames[] = {
        "CRIT", "ERROR", "WARN", "INFO", "DEBUG", "NOTSET"
    };
    const size_t g_levelCount = sizeof(g_levelNames) / sizeof(string);
}

const string& Priority::getPriorityName(Value priority) noexcept
{
    if (priority < SAMLSP_CRIT || priority > SAMLSP_NOTSET) {
        return g_levelNames[g_levelCount - 1];
    }
    return g_levelNames[priority / 100];
}

Priority::Value Priority::getPriorityValue(const string& priorityName)
{
    string name = boost::to_upper_copy(boost::trim_copy(priorityName));
    for (size_t i = 0; i < g_levelCount; ++i) {
        if (name == g_levelNames[i]) {
            return static_cast<Value>(i * 100);
        }
    }

    if (!name.empty()) {
        char* endPointer = nullptr;
        long value = strtol(name.c_str(), &endPointer, 10);
        if (endPointer && *endPointer == 0) {
            return static_cast<Value>(value);
        }
    }

    throw invalid_argument(string("unknown priority name: '") + priorityName + "'");
}
