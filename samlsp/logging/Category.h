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
 * @file samlsp/logging/Category.h
 *
 * Named logging channel.
 */

#ifndef __samlsp_logging_category_h__
#define __samlsp_logging_category_h__

#include <samlsp/logging/Priority.h>

#include <cstdarg>
#include <string>

namespace samlsp {

    class SAMLSP_API LoggingServiceSPI;

    /**
     * A named logging channel with a fixed priority threshold.
     *
     * <p>Categories are owned by the LoggingService that created them and are
     * obtained by name. Messages below the threshold are discarded before any
     * formatting takes place.</p>
     */
    class SAMLSP_API Category {
        MAKE_NONCOPYABLE(Category);
    public:
        /**
         * Returns the Category of the given name from the library's logging service.
         *
         * <p>Throws if the library is not initialized.</p>
         *
         * @param name  category name
         * @return  the shared Category
         */
        static Category& getInstance(const std::string& name);

        virtual ~Category();

        /**
         * Returns the category name.
         *
         * @return the category name
         */
        const std::string& getName() const;

        /**
         * Returns the priority threshold of this Category.
         *
         * @return the threshold
         */
        Priority::Value getPriority() const;

        /**
         * Returns true iff a message of the given priority would be output.
         *
         * @param priority  priority to test
         * @return true iff logging is enabled at that priority
         */
        bool isPriorityEnabled(Priority::Value priority) const;

        /**
         * Formats and outputs a message, printf-style.
         *
         * @param priority      priority of the message
         * @param stringFormat  format specifier
         * @param ...           format arguments
         */
        void log(Priority::Value priority, const char* stringFormat, ...) noexcept;

        /**
         * Outputs a pre-formatted message.
         *
         * @param priority  priority of the message
         * @param message   message to output
         */
        void log(Priority::Value priority, const std::string& message) noexcept;

        void debug(const char* stringFormat, ...) noexcept;
        void debug(const std::string& message) noexcept;
        bool isDebugEnabled() const {
            return isPriorityEnabled(Priority::SAMLSP_DEBUG);
        }

        void info(const char* stringFormat, ...) noexcept;
        void info(const std::string& message) noexcept;
        bool isInfoEnabled() const {
            return isPriorityEnabled(Priority::SAMLSP_INFO);
        }

        void warn(const char* stringFormat, ...) noexcept;
        void warn(const std::string& message) noexcept;
        bool isWarnEnabled() const {
            return isPriorityEnabled(Priority::SAMLSP_WARN);
        }

        void error(const char* stringFormat, ...) noexcept;
        void error(const std::string& message) noexcept;
        bool isErrorEnabled() const {
            return isPriorityEnabled(Priority::SAMLSP_ERROR);
        }

        void crit(const char* stringFormat, ...) noexcept;
        void crit(const std::string& message) noexcept;

    protected:
        /**
         * Constructor.
         *
         * @param spi       the output side of the owning logging service
         * @param name      the category name
         * @param priority  the priority threshold
         */
        Category(LoggingServiceSPI& spi, const std::string& name, Priority::Value priority);

    private:
        void output(Priority::Value priority, const char* format, va_list arguments) noexcept;
        void output(Priority::Value priority, const std::string& message) noexcept;

        LoggingServiceSPI& m_spi;
        const std::string m_name;
        Priority::Value m_priority;
    };

}

#endif // __samlsp_logging_category_h__
