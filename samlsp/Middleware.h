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
 * @file samlsp/Middleware.h
 *
 * Fully resolved SP configuration with its trusted IdPs.
 */

#ifndef __samlsp_middleware_h__
#define __samlsp_middleware_h__

#include <samlsp/ServiceProvider.h>

#include <chrono>
#include <memory>
#include <string>

namespace samlsp {

    class SAMLSP_API CancellationToken;
    class SAMLSP_API HTTPClient;
    class SAMLSP_API Options;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * SP configuration built from Options, with defaults applied and endpoint
     * URLs derived from the base URL.
     *
     * <p>Construction is synchronous. If a metadata URL is configured the
     * document is fetched, with retries, before the constructor returns, and
     * any failure propagates out of the constructor. The library must be
     * initialized first.</p>
     */
    class SAMLSP_API Middleware
    {
        MAKE_NONCOPYABLE(Middleware);
    public:
        /**
         * Constructor.
         *
         * <p>Raises ConfigurationException for a missing or malformed base URL,
         * key or certificate, and any metadata loading failure as is.</p>
         *
         * @param opts  options to build from
         * @param token optional token to cancel a metadata fetch
         */
        Middleware(const Options& opts, const CancellationToken* token=nullptr);
        ~Middleware();

        /** Path appended to the base URL to form the metadata URL. */
        static const char METADATA_PATH[];

        /** Path appended to the base URL to form the ACS URL. */
        static const char ACS_PATH[];

        static const char DEFAULT_COOKIE_NAME[];
        static const unsigned int DEFAULT_COOKIE_MAX_AGE;
        static const unsigned int DEFAULT_RETRY_COUNT;

        /** Default wait between fetch attempts, in seconds. */
        static const unsigned int DEFAULT_RETRY_DELAY;

        /**
         * Decodes IdP metadata and registers the IdP.
         *
         * <p>The document may hold one EntityDescriptor or an EntitiesDescriptor,
         * in which case its first IdP is used. On failure nothing changes.</p>
         *
         * @param data  metadata document
         */
        void addIDPMetadata(const std::string& data);

        /**
         * Fetches IdP metadata and registers the IdP.
         *
         * @param client    HTTP client, or null for the library default
         * @param url       location of the metadata
         * @param token     optional token to cancel the fetch
         */
        void fetchIDPMetadata(const HTTPClient* client, const URL& url, const CancellationToken* token=nullptr);

        const ServiceProvider& getServiceProvider() const {
            return m_sp;
        }

        bool getAllowIDPInitiated() const {
            return m_allowIDPInitiated;
        }

        const std::string& getCookieName() const {
            return m_cookieName;
        }

        /**
         * Returns the session cookie lifetime.
         *
         * @return lifetime in seconds
         */
        unsigned int getCookieMaxAge() const {
            return m_cookieMaxAge;
        }

        const std::string& getCookieDomain() const {
            return m_cookieDomain;
        }

        unsigned int getRetryCount() const {
            return m_retryCount;
        }

        std::chrono::milliseconds getRetryDelay() const {
            return m_retryDelay;
        }

    private:
        Category& m_log;
        ServiceProvider m_sp;
        bool m_allowIDPInitiated;
        std::string m_cookieName;
        unsigned int m_cookieMaxAge;
        std::string m_cookieDomain;
        unsigned int m_retryCount;
        std::chrono::milliseconds m_retryDelay;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_middleware_h__ */
