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
 * @file samlsp/util/Misc.h
 *
 * Miscellaneous utilities.
 */

#ifndef __samlsp_misc_h__
#define __samlsp_misc_h__

#include <samlsp/base.h>

#include <string>
#include <vector>

namespace samlsp {

    struct SAMLSP_API FileSupport {
        /**
         * Reads the entire content of a file.
         *
         * <p>Throws IOException if the file cannot be read.</p>
         *
         * @param path  path to read
         * @return  the file content
         */
        static std::string read(const char* path);
    };

    /**
     * Splitter function that trims the input and splits on whitespace into a container.
     */
    SAMLSP_API std::vector<std::string>::size_type split_to_container(std::vector<std::string>& container, const char* s);
};

#endif /* __samlsp_misc_h__ */
