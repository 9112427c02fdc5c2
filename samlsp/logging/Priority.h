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
 * @file samlsp/logging/Priority.h
 *
 * Logging levels understood by the library.
 */

#ifndef __samlsp_logging_priority_h__
#define __samlsp_logging_priority_h__

#include <samlsp/base.h>

#include <string>

namespace samlsp {

    /**
     * Logging levels, ordered from most to least severe.
     */
    class SAMLSP_API Priority {
    public:
        enum PriorityLevel {
            SAMLSP_CRIT   = 0,
            SAMLSP_ERROR  = 100,
            SAMLSP_WARN   = 200,
            SAMLSP_INFO   = 300,
            SAMLSP_DEBUG  = 400,
            SAMLSP_NOTSET = 500
        };

        typedef int Value;

        /**
         * Returns the name of a priority value.
         *
         * <p>Values in between two levels map to the more severe of the two,
         * values out of range map to "NOTSET".</p>
         *
         * @param priority  numeric priority
         * @return  the level name
         */
        static const std::string& getPriorityName(Value priority) noexcept;

        /**
         * Returns the value of a level name, or of a decimal number.
         *
         * @param priorityName  a level name (CRIT to NOTSET) or a number
         * @return the matching value
         *
         * @throw std::invalid_argument if the input is neither a level name nor a number
         */
        static Value getPriorityValue(const std::string& priorityName);
    };
}

#endif // __samlsp_logging_priority_h__
