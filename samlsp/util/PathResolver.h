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
 * @file samlsp/util/PathResolver.h
 *
 * Resolves local filenames into absolute pathnames.
 */

#ifndef __samlsp_pathres_h__
#define __samlsp_pathres_h__

#include <samlsp/base.h>

#include <string>

namespace samlsp {

#if defined (_MSC_VER)
#    pragma warning( push )
#    pragma warning( disable : 4251 )
#endif

    /**
     * Resolves relative file names against the installation layout.
     *
     * <p>A relative name is placed under the directory for its file type, and that
     * directory, if itself relative, under the installation prefix. Names that
     * start with "/", "./" or "../" are left alone.</p>
     */
    class SAMLSP_API PathResolver
    {
        MAKE_NONCOPYABLE(PathResolver);
    public:
        PathResolver();
        virtual ~PathResolver();

        /** Types of file resources to resolve. */
        enum file_type_t {
            SAMLSP_LOG_FILE,
            SAMLSP_CFG_FILE
        };

        /**
         * Sets the installation prefix.
         *
         * @param prefix    installation prefix
         */
        void setDefaultPrefix(const char* prefix);

        /**
         * Sets the log directory, absolute or relative to the prefix.
         *
         * @param dir   log directory
         */
        void setLogDir(const char* dir);

        /**
         * Sets the configuration directory, absolute or relative to the prefix.
         *
         * @param dir   configuration directory
         */
        void setCfgDir(const char* dir);

        /**
         * Resolves a file name in place.
         *
         * @param s         file name to resolve
         * @param filetype  type of file
         * @return  reference to the same string, after resolution
         */
        const std::string& resolve(std::string& s, file_type_t filetype) const;

    private:
        bool isAbsolute(const char* s) const;

        std::string m_defaultPrefix, m_log, m_cfg;
    };

#if defined (_MSC_VER)
#   pragma warning( pop )
#endif
};

#endif /* __samlsp_pathres_h__ */
