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
 * impl/ServiceProvider.cpp
 *
 * SAML SP identity and trusted IdPs.
 */

#include "internal.h"
#include "exceptions.h"
#include "ServiceProvider.h"
#include "logging/Category.h"
#include "metadata/MetadataParser.h"
#include "security/Credential.h"

using namespace samlsp;
using namespace opensaml;
using namespace std;

ServiceProvider::ServiceProvider(
    const shared_ptr<const PrivateKey>& key,
    const shared_ptr<const Certificate>& certificate,
    Category& log,
    const URL& metadataURL,
    const URL& acsURL,
    const shared_ptr<const saml2md::EntityDescriptor>& idpMetadata,
    boost::logic::tribool forceAuthn
    ) : m_key(key), m_certificate(certificate), m_log(log), m_metadataURL(metadataURL), m_acsURL(acsURL),
        m_idpMetadata(idpMetadata), m_forceAuthn(forceAuthn)
{
    if (!m_key) {
        throw ConfigurationException("ServiceProvider requires a private key.");
    }
    if (!m_certificate) {
        throw ConfigurationException("ServiceProvider requires a certificate.");
    }
}

ServiceProvider::~ServiceProvider()
{
}

shared_ptr<const saml2md::EntityDescriptor> ServiceProvider::getIDPMetadata(const char* entityID) const
{
    return m_registry.get(entityID);
}

void ServiceProvider::addIDPMetadata(const shared_ptr<const saml2md::EntityDescriptor>& entity)
{
    m_registry.add(entity);
    m_idpMetadata = entity;
    m_log.info("registered IdP (%s), %u IdP(s) now trusted", MetadataParser::getEntityID(*entity).c_str(),
        static_cast<unsigned int>(m_registry.size()));
}
