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
 * logging/impl/ConsoleLoggingService.cpp
 *
 * Logging service implementation using the console.
 */

#include "internal.h"
#include "logging/impl/AbstractLoggingService.h"

#include <iostream>
#include <mutex>

using namespace samlsp;
using namespace boost::property_tree;
using namespace std;

namespace samlsp {

    class SAMLSP_DLLLOCAL ConsoleLoggingService : public virtual AbstractLoggingService {
    public:
        ConsoleLoggingService(const ptree& pt);

        void outputMessage(const Category& category, Priority::Value prio, const string& message);

    private:
        bool m_stderr;
        mutex m_outputLock;
    };

    LoggingService* SAMLSP_DLLLOCAL ConsoleLoggingServiceFactory(const ptree& pt, bool) {
        return new ConsoleLoggingService(pt);
    }

}

ConsoleLoggingService::ConsoleLoggingService(const ptree& pt) : AbstractLoggingService(pt), m_stderr(false)
{
    static const char STREAM_PROP_PATH[] = "logging.stream";
    m_stderr = pt.get(STREAM_PROP_PATH, "stdout") == "stderr";
}

void ConsoleLoggingService::outputMessage(const Category& category, Priority::Value prio, const string& message)
{
    string line = formatMessage(category, prio, message);

    lock_guard<mutex> locker(m_outputLock);
    (m_stderr ? cerr : cout) << line << endl;
}
