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
 * logging/impl/Category.cpp
 *
 * Named logging channel.
 */

#include "internal.h"
#include "LibraryConfig.h"
#include "logging/Category.h"
#include "logging/LoggingService.h"
#include "logging/impl/LoggingServiceSPI.h"
#include "logging/impl/StringUtil.h"

using namespace samlsp;
using namespace std;

#define SAMLSP_CATEGORY_LOG(level) \
    if (isPriorityEnabled(level)) { \
        va_list va; \
        va_start(va, stringFormat); \
        output(level, stringFormat, va); \
        va_end(va); \
    }

Category& Category::getInstance(const string& name)
{
    return LibraryConfig::getConfig().getLoggingService().getCategory(name);
}

Category::Category(LoggingServiceSPI& spi, const string& name, Priority::Value priority)
    : m_spi(spi), m_name(name), m_priority(priority)
{
}

Category::~Category()
{
}

const string& Category::getName() const
{
    return m_name;
}

Priority::Value Category::getPriority() const
{
    return m_priority;
}

bool Category::isPriorityEnabled(Priority::Value priority) const
{
    return m_priority >= priority;
}

void Category::output(Priority::Value priority, const char* format, va_list arguments) noexcept
{
    try {
        m_spi.outputMessage(*this, priority, StringUtil::vform(format, arguments));
    }
    catch (const exception&) {
        // Nowhere left to report a failure to log.
    }
}

void Category::output(Priority::Value priority, const string& message) noexcept
{
    try {
        m_spi.outputMessage(*this, priority, message);
    }
    catch (const exception&) {
    }
}

void Category::log(Priority::Value priority, const char* stringFormat, ...) noexcept
{
    SAMLSP_CATEGORY_LOG(priority);
}

void Category::log(Priority::Value priority, const string& message) noexcept
{
    if (isPriorityEnabled(priority)) {
        output(priority, message);
    }
}

void Category::debug(const char* stringFormat, ...) noexcept
{
    SAMLSP_CATEGORY_LOG(Priority::SAMLSP_DEBUG);
}

void Category::debug(const string& message) noexcept
{
    log(Priority::SAMLSP_DEBUG, message);
}

void Category::info(const char* stringFormat, ...) noexcept
{
    SAMLSP_CATEGORY_LOG(Priority::SAMLSP_INFO);
}

void Category::info(const string& message) noexcept
{
    log(Priority::SAMLSP_INFO, message);
}

void Category::warn(const char* stringFormat, ...) noexcept
{
    SAMLSP_CATEGORY_LOG(Priority::SAMLSP_WARN);
}

void Category::warn(const string& message) noexcept
{
    log(Priority::SAMLSP_WARN, message);
}

void Category::error(const char* stringFormat, ...) noexcept
{
    SAMLSP_CATEGORY_LOG(Priority::SAMLSP_ERROR);
}

void Category::error(const string& message) noexcept
{
    log(Priority::SAMLSP_ERROR, message);
}

void Category::crit(const char* stringFormat, ...) noexcept
{
    SAMLSP_CATEGORY_LOG(Priority::SAMLSP_CRIT);
}

void Category::crit(const string& message) noexcept
{
    log(Priority::SAMLSP_CRIT, message);
}
