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
 * logging/impl/StringUtil.h
 *
 * printf-style formatting into a std::string.
 */

#ifndef __samlsp_logging_stringutil_h__
#define __samlsp_logging_stringutil_h__

#include "internal.h"

#include <string>
#include <cstdarg>

namespace samlsp {

    class StringUtil {
        MAKE_NONCOPYABLE(StringUtil);
        StringUtil() {}
    public:
        /**
         * Returns a string built from a format specifier and a va_list, as vprintf(3) would.
         *
         * @param format the format specifier
         * @param args the arguments
         */
        static std::string vform(const char* format, va_list args);
    };

}

#endif // __samlsp_logging_stringutil_h__
