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
 * logging/impl/AbstractLoggingService.cpp
 *
 * Base class for logging service implementations.
 */

#include "internal.h"

#include "LibraryConfig.h"
#include "logging/impl/AbstractLoggingService.h"

#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>

using namespace samlsp;
using namespace boost::property_tree;
using namespace std;

namespace samlsp {
    class SAMLSP_DLLLOCAL CategoryImpl : public Category {
    public:
        CategoryImpl(LoggingServiceSPI& spi, const string& name, Priority::Value priority)
            : Category(spi, name, priority) {
        }
    };

    extern LoggingService* SAMLSP_DLLLOCAL ConsoleLoggingServiceFactory(const ptree& pt, bool);
    extern LoggingService* SAMLSP_DLLLOCAL FileLoggingServiceFactory(const ptree& pt, bool);
}

void SAMLSP_API samlsp::registerLoggingServices()
{
    LibraryConfig& conf = LibraryConfig::getConfig();
    conf.LoggingServiceManager.registerFactory(CONSOLE_LOGGING_SERVICE, ConsoleLoggingServiceFactory);
    conf.LoggingServiceManager.registerFactory(FILE_LOGGING_SERVICE, FileLoggingServiceFactory);
}

const char LoggingService::LOGGING_TYPE_PROP_PATH[] = "logging.type";
const char AbstractLoggingService::CATEGORIES_SECTION_NAME[] = "logging-categories";
const char AbstractLoggingService::DEFAULT_LEVEL_PROP_PATH[] = "logging.default-level";

LoggingService::LoggingService() {}

LoggingService::~LoggingService() {}

LoggingServiceSPI::LoggingServiceSPI() {}

LoggingServiceSPI::~LoggingServiceSPI() {}

AbstractLoggingService::AbstractLoggingService(const ptree& pt)
    : m_config(pt), m_defaultPriority(Priority::SAMLSP_INFO)
{
}

AbstractLoggingService::~AbstractLoggingService() {}

bool AbstractLoggingService::init()
{
    // An unparseable level falls back to INFO, for the default and per-category alike.

    try {
        m_defaultPriority = Priority::getPriorityValue(m_config.get(DEFAULT_LEVEL_PROP_PATH, "INFO"));
    } catch (const invalid_argument&) {
        m_defaultPriority = Priority::SAMLSP_INFO;
    }

    const boost::optional<const ptree&> categories = m_config.get_child_optional(CATEGORIES_SECTION_NAME);
    if (categories) {
        for (const auto& mapping : categories.get()) {
            Priority::Value prio = Priority::SAMLSP_INFO;
            try {
                prio = Priority::getPriorityValue(mapping.second.get_value<string>("INFO"));
            } catch (const invalid_argument&) {
            }
            m_priorityMap[mapping.first] = prio;
        }
    }

    return true;
}

void AbstractLoggingService::term()
{
}

Category& AbstractLoggingService::getCategory(const string& name)
{
    lock_guard<mutex> locker(m_lock);

    const auto& cat = m_categoryMap.find(name);
    if (cat != m_categoryMap.end()) {
        return *(cat->second);
    }

    const auto& level = m_priorityMap.find(name);
    Priority::Value prio = level != m_priorityMap.end() ? level->second : m_defaultPriority;

    auto inserted = m_categoryMap.insert(make_pair(name, unique_ptr<Category>(new CategoryImpl(*this, name, prio))));
    return *(inserted.first->second);
}

string AbstractLoggingService::formatMessage(const Category& category, Priority::Value prio, const string& message) const
{
    auto now = chrono::system_clock::now();
    time_t secs = chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(
        chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count() % 1000
        );

    struct tm utc;
#ifdef WIN32
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif

    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);
    char fraction[8];
    snprintf(fraction, sizeof(fraction), ".%03ldZ", millis);

    return string(stamp) + fraction + " - " + Priority::getPriorityName(prio)
        + " [" + category.getName() + "] - " + message;
}
