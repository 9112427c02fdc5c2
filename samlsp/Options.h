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
 * @file samlsp/Options.h
 *
 * Parameters for building a Middleware.
 */

#ifndef __samlsp_options_h__
#define __samlsp_options_h__

#include <samlsp/util/URL.h>

#include <chrono>
#include <memory>
#include <string>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

namespace opensaml {
    namespace saml2md {
        class SAML_API EntityDescriptor;
    };
};

namespace samlsp {

    class SAMLSP_API Category;
    class SAMLSP_API Certificate;
    class SAMLSP_API HTTPClient;
    class SAMLSP_API PrivateKey;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Declarative parameters for a Middleware.
     *
     * <p>Members left unset take the Middleware defaults. Options may be filled in
     * by hand, loaded from a property tree, or both.</p>
     */
    class SAMLSP_API Options
    {
    public:
        Options();
        ~Options();

        /** Base URL of the SP; the metadata and ACS URLs are derived from it. */
        URL url;

        /** SP private key. */
        std::shared_ptr<const PrivateKey> key;

        /** SP certificate. */
        std::shared_ptr<const Certificate> certificate;

        /** Logging category, or null for the library default. */
        Category* logger;

        bool allowIDPInitiated;

        /** IdP metadata to start with; becomes the primary IdP without being registered. */
        std::shared_ptr<const opensaml::saml2md::EntityDescriptor> idpMetadata;

        /** Location to fetch IdP metadata from during construction. */
        boost::optional<URL> idpMetadataURL;

        /** Local IdP metadata document to register during construction. */
        std::string idpMetadataFile;

        /** HTTP client for metadata fetches, or null for the library default. */
        const HTTPClient* httpClient;

        /** Session cookie lifetime in seconds; 0 selects the default. */
        unsigned int cookieMaxAge;

        /** Session cookie name; empty selects the default. */
        std::string cookieName;

        bool forceAuthn;

        /** Retries after the first fetch attempt; unset selects the default. */
        boost::optional<unsigned int> retryCount;

        /** Wait between fetch attempts; unset selects the default. */
        boost::optional<std::chrono::milliseconds> retryDelay;

        /**
         * Loads options from a property tree, typically the [sp] section of the
         * library configuration.
         *
         * <p>Only the properties present are applied. Relative file names are
         * resolved against the configuration directory. Raises ConfigurationException
         * for malformed values and IOException for unreadable key material.</p>
         *
         * @param pt    property tree to read
         */
        void load(const boost::property_tree::ptree& pt);

        static const char BASE_URL_PROP_NAME[];
        static const char KEY_FILE_PROP_NAME[];
        static const char KEY_PASSWORD_PROP_NAME[];
        static const char CERTIFICATE_FILE_PROP_NAME[];
        static const char ALLOW_IDP_INITIATED_PROP_NAME[];
        static const char FORCE_AUTHN_PROP_NAME[];
        static const char COOKIE_NAME_PROP_NAME[];
        static const char COOKIE_MAX_AGE_PROP_NAME[];
        static const char RETRY_COUNT_PROP_NAME[];
        static const char RETRY_DELAY_PROP_NAME[];
        static const char IDP_METADATA_URL_PROP_NAME[];
        static const char IDP_METADATA_FILE_PROP_NAME[];
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_options_h__ */
