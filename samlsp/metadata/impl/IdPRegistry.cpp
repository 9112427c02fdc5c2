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
 * metadata/impl/IdPRegistry.cpp
 *
 * Trusted IdPs keyed by entityID.
 */

#include "internal.h"
#include "metadata/IdPRegistry.h"
#include "metadata/MetadataParser.h"

#include <stdexcept>
#include <saml/saml2/metadata/Metadata.h>

using namespace samlsp;
using namespace opensaml;
using namespace std;

IdPRegistry::IdPRegistry()
{
}

IdPRegistry::~IdPRegistry()
{
}

void IdPRegistry::add(const shared_ptr<const saml2md::EntityDescriptor>& entity)
{
    if (!entity) {
        throw invalid_argument("Cannot register a null EntityDescriptor.");
    }
    m_entities[MetadataParser::getEntityID(*entity)] = entity;
}

shared_ptr<const saml2md::EntityDescriptor> IdPRegistry::get(const char* entityID) const
{
    if (entityID) {
        map< string,shared_ptr<const saml2md::EntityDescriptor> >::const_iterator i = m_entities.find(entityID);
        if (i != m_entities.end()) {
            return i->second;
        }
    }
    return shared_ptr<const saml2md::EntityDescriptor>();
}

size_t IdPRegistry::size() const
{
    return m_entities.size();
}

vector<string> IdPRegistry::getEntityIDs() const
{
    vector<string> ids;
    for (const pair< const string,shared_ptr<const saml2md::EntityDescriptor> >& entry : m_entities) {
        ids.push_back(entry.first);
    }
    return ids;
}
