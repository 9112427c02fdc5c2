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
 * util/PathResolver.cpp
 *
 * Resolves local filenames into absolute pathnames.
 */

#include "internal.h"
#include "util/PathResolver.h"

#include <stdexcept>

using namespace samlsp;
using namespace std;

PathResolver::PathResolver() : m_defaultPrefix("/usr")
{
    setLogDir("/var/log");
    setCfgDir("/etc");
}

PathResolver::~PathResolver()
{
}

void PathResolver::setDefaultPrefix(const char* prefix)
{
    m_defaultPrefix = prefix ? prefix : "";
}

void PathResolver::setLogDir(const char* dir)
{
    m_log = dir ? dir : "";
}

void PathResolver::setCfgDir(const char* dir)
{
    m_cfg = dir ? dir : "";
}

bool PathResolver::isAbsolute(const char* s) const
{
    switch (*s) {
        case 0:
            return false;
        case '/':
        case '\\':
            return true;
        case '.':
            return (*(s+1) == '.' || *(s+1) == '/' || *(s+1) == '\\');
    }
    return *(s+1) == ':';
}

const string& PathResolver::resolve(string& s, file_type_t filetype) const
{
    if (s.empty() || isAbsolute(s.c_str())) {
        return s;
    }

    const string* dir = nullptr;
    switch (filetype) {
        case SAMLSP_LOG_FILE:
            dir = &m_log;
            break;
        case SAMLSP_CFG_FILE:
            dir = &m_cfg;
            break;
        default:
            throw invalid_argument("Unknown file type to resolve.");
    }

    s = *dir + '/' + s;
    if (!isAbsolute(dir->c_str())) {
        s = m_defaultPrefix + '/' + s;
    }
    return s;
}
