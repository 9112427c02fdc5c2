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
 * util/URL.cpp
 *
 * Absolute URL value type.
 */

#include "internal.h"
#include "util/URL.h"

#include <cctype>
#include <stdexcept>
#include <boost/algorithm/string.hpp>

using namespace samlsp;
using namespace std;

URL::URL() : m_ipv6(false)
{
}

URL::URL(const string& s) : m_ipv6(false)
{
    // break apart the string into scheme, authority, and "the rest"
    string::size_type colon = s.find("://");
    if (colon == string::npos || colon == 0) {
        throw invalid_argument("URL (" + s + ") has no scheme.");
    }
    for (string::size_type i = 0; i < colon; ++i) {
        const unsigned char ch = s[i];
        if (!(isalpha(ch) || (i > 0 && (isdigit(ch) || ch == '+' || ch == '-' || ch == '.')))) {
            throw invalid_argument("URL (" + s + ") has an invalid scheme.");
        }
    }
    m_scheme = boost::to_lower_copy(s.substr(0, colon));

    string::size_type start = colon + 3;
    string::size_type end = s.find_first_of("/?#", start);
    string authority = s.substr(start, end == string::npos ? string::npos : end - start);

    string::size_type at = authority.rfind('@');
    if (at != string::npos) {
        m_userinfo = authority.substr(0, at);
        authority.erase(0, at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        string::size_type bracket = authority.find(']');
        if (bracket == string::npos) {
            throw invalid_argument("URL (" + s + ") has an unterminated IPv6 address.");
        }
        m_ipv6 = true;
        m_host = authority.substr(1, bracket - 1);
        authority.erase(0, bracket + 1);
        if (!authority.empty()) {
            if (authority[0] != ':') {
                throw invalid_argument("URL (" + s + ") has an invalid authority.");
            }
            m_port = authority.substr(1);
        }
    }
    else {
        string::size_type portsep = authority.rfind(':');
        if (portsep != string::npos) {
            m_port = authority.substr(portsep + 1);
            authority.erase(portsep);
        }
        m_host = authority;
    }

    if (!boost::all(m_port, boost::is_digit())) {
        throw invalid_argument("URL (" + s + ") has an invalid port.");
    }

    if (end == string::npos) {
        return;
    }

    string rest = s.substr(end);
    string::size_type hash = rest.find('#');
    if (hash != string::npos) {
        m_fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    string::size_type query = rest.find('?');
    if (query != string::npos) {
        m_query = rest.substr(query + 1);
        rest.erase(query);
    }
    m_path = rest;
}

URL::~URL()
{
}

string URL::getHostPort() const
{
    string ret(m_ipv6 ? '[' + m_host + ']' : m_host);
    if (!m_port.empty()) {
        ret += ':' + m_port;
    }
    return ret;
}

bool URL::isAbsolute() const
{
    return !m_scheme.empty() && !m_host.empty();
}

URL URL::appendPath(const char* suffix) const
{
    URL ret(*this);
    if (suffix) {
        ret.m_path += suffix;
    }
    return ret;
}

string URL::toString() const
{
    if (m_scheme.empty()) {
        return string();
    }

    string ret(m_scheme + "://");
    if (!m_userinfo.empty()) {
        ret += m_userinfo + '@';
    }
    ret += getHostPort() + m_path;
    if (!m_query.empty()) {
        ret += '?' + m_query;
    }
    if (!m_fragment.empty()) {
        ret += '#' + m_fragment;
    }
    return ret;
}
