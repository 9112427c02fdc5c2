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
 * @file samlsp/metadata/IdPRegistry.h
 *
 * Trusted IdPs keyed by entityID.
 */

#ifndef __samlsp_idpregistry_h__
#define __samlsp_idpregistry_h__

#include <samlsp/base.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace opensaml {
    namespace saml2md {
        class SAML_API EntityDescriptor;
    };
};

namespace samlsp {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * In-memory map from entityID to IdP metadata.
     *
     * <p>Adding an entity whose entityID is already present replaces the earlier
     * entry. The registry does no locking.</p>
     */
    class SAMLSP_API IdPRegistry
    {
        MAKE_NONCOPYABLE(IdPRegistry);
    public:
        IdPRegistry();
        ~IdPRegistry();

        /**
         * Adds or replaces an entity.
         *
         * @param entity    entity to add
         */
        void add(const std::shared_ptr<const opensaml::saml2md::EntityDescriptor>& entity);

        /**
         * Returns the entity registered under an entityID.
         *
         * @param entityID  entityID to look up
         * @return  the entity, or null
         */
        std::shared_ptr<const opensaml::saml2md::EntityDescriptor> get(const char* entityID) const;

        /**
         * Returns the number of registered entities.
         *
         * @return entity count
         */
        size_t size() const;

        /**
         * Returns the registered entityIDs in sorted order.
         *
         * @return entityIDs
         */
        std::vector<std::string> getEntityIDs() const;

    private:
        std::map< std::string,std::shared_ptr<const opensaml::saml2md::EntityDescriptor> > m_entities;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_idpregistry_h__ */
