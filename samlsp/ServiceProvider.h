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
 * @file samlsp/ServiceProvider.h
 *
 * SAML SP identity and trusted IdPs.
 */

#ifndef __samlsp_sp_h__
#define __samlsp_sp_h__

#include <samlsp/metadata/IdPRegistry.h>
#include <samlsp/util/URL.h>

#include <memory>
#include <boost/logic/tribool.hpp>

namespace opensaml {
    namespace saml2md {
        class SAML_API EntityDescriptor;
    };
};

namespace samlsp {

    class SAMLSP_API Category;
    class SAMLSP_API Certificate;
    class SAMLSP_API PrivateKey;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * The state a SAML protocol engine needs to act as an SP.
     *
     * <p>The metadata and ACS URLs are fixed at construction. The IdP registry and
     * the primary IdP change only through addIDPMetadata(), which the owning
     * Middleware calls while it is being built.</p>
     */
    class SAMLSP_API ServiceProvider
    {
        MAKE_NONCOPYABLE(ServiceProvider);
    public:
        /**
         * Constructor.
         *
         * @param key           SP private key
         * @param certificate   SP certificate
         * @param log           logging category
         * @param metadataURL   URL the SP's metadata is served from
         * @param acsURL        URL of the SP's assertion consumer service
         * @param idpMetadata   initial primary IdP, possibly null
         * @param forceAuthn    whether to require fresh authentication
         */
        ServiceProvider(
            const std::shared_ptr<const PrivateKey>& key,
            const std::shared_ptr<const Certificate>& certificate,
            Category& log,
            const URL& metadataURL,
            const URL& acsURL,
            const std::shared_ptr<const opensaml::saml2md::EntityDescriptor>& idpMetadata,
            boost::logic::tribool forceAuthn
            );
        ~ServiceProvider();

        const PrivateKey& getKey() const {
            return *m_key;
        }

        const Certificate& getCertificate() const {
            return *m_certificate;
        }

        Category& getLogger() const {
            return m_log;
        }

        const URL& getMetadataURL() const {
            return m_metadataURL;
        }

        const URL& getAcsURL() const {
            return m_acsURL;
        }

        /**
         * Returns the primary IdP: the most recently registered one, or the initial
         * one if none has been registered.
         *
         * @return the primary IdP, or null
         */
        std::shared_ptr<const opensaml::saml2md::EntityDescriptor> getIDPMetadata() const {
            return m_idpMetadata;
        }

        /**
         * Returns a registered IdP.
         *
         * @param entityID  entityID of the IdP
         * @return  the IdP, or null
         */
        std::shared_ptr<const opensaml::saml2md::EntityDescriptor> getIDPMetadata(const char* entityID) const;

        const IdPRegistry& getIDPRegistry() const {
            return m_registry;
        }

        /**
         * Returns the ForceAuthn setting; indeterminate means unset.
         *
         * @return ForceAuthn
         */
        boost::logic::tribool getForceAuthn() const {
            return m_forceAuthn;
        }

        /**
         * Registers an IdP and makes it the primary one.
         *
         * @param entity    IdP to register
         */
        void addIDPMetadata(const std::shared_ptr<const opensaml::saml2md::EntityDescriptor>& entity);

    private:
        std::shared_ptr<const PrivateKey> m_key;
        std::shared_ptr<const Certificate> m_certificate;
        Category& m_log;
        const URL m_metadataURL, m_acsURL;
        std::shared_ptr<const opensaml::saml2md::EntityDescriptor> m_idpMetadata;
        IdPRegistry m_registry;
        boost::logic::tribool m_forceAuthn;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_sp_h__ */
