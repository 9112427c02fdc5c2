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
 * @file samlsp/util/URL.h
 *
 * Absolute URL value type.
 */

#ifndef __samlsp_url_h__
#define __samlsp_url_h__

#include <samlsp/base.h>

#include <string>

namespace samlsp {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * A URL broken into its components.
     *
     * <p>Parsing is structural only: no percent-decoding or path normalization
     * is performed, so toString() reproduces the input apart from the scheme,
     * which is lowercased.</p>
     */
    class SAMLSP_API URL
    {
    public:
        URL();

        /**
         * Parses a URL of the form scheme://[userinfo@]host[:port][/path][?query][#fragment].
         *
         * <p>Throws std::invalid_argument if the string is not of that form.</p>
         *
         * @param s URL to parse
         */
        URL(const std::string& s);

        ~URL();

        const std::string& getScheme() const {
            return m_scheme;
        }

        const std::string& getUserInfo() const {
            return m_userinfo;
        }

        /**
         * Returns the host name, without any port or IPv6 brackets.
         *
         * @return host name
         */
        const std::string& getHost() const {
            return m_host;
        }

        /**
         * Returns the port as written, or an empty string.
         *
         * @return port
         */
        const std::string& getPort() const {
            return m_port;
        }

        /**
         * Returns the authority as written, host plus optional port.
         *
         * @return host and port
         */
        std::string getHostPort() const;

        const std::string& getPath() const {
            return m_path;
        }

        const std::string& getQuery() const {
            return m_query;
        }

        const std::string& getFragment() const {
            return m_fragment;
        }

        /**
         * Returns true iff the URL has a scheme and a host.
         *
         * @return true iff the URL is absolute
         */
        bool isAbsolute() const;

        /**
         * Returns a copy of this URL with a suffix appended to its path.
         *
         * <p>All other components are preserved.</p>
         *
         * @param suffix    text to append to the path
         * @return  the extended URL
         */
        URL appendPath(const char* suffix) const;

        /**
         * Serializes the URL.
         *
         * @return the URL as a string
         */
        std::string toString() const;

    private:
        std::string m_scheme, m_userinfo, m_host, m_port, m_path, m_query, m_fragment;
        bool m_ipv6;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_url_h__ */
