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
 * metadata/impl/MetadataParser.cpp
 *
 * Decodes SAML metadata documents.
 */

#include "internal.h"
#include "exceptions.h"
#include "logging/Category.h"
#include "metadata/MetadataParser.h"
#include "util/SPConstants.h"

#include <sstream>
#include <saml/saml2/metadata/Metadata.h>
#include <xmltooling/unicode.h>
#include <xmltooling/XMLObjectBuilder.h>
#include <xmltooling/XMLToolingConfig.h>
#include <xmltooling/util/ParserPool.h>
#include <xmltooling/util/XMLHelper.h>
#include <xercesc/util/XMLException.hpp>

using namespace samlsp;
using namespace samlspconstants;
using namespace opensaml;
using namespace xmltooling;
using namespace std;

namespace {
    /* Parses a document and unmarshalls its root, binding the DOM to the result. */
    XMLObject* unmarshall(const string& data)
    {
        try {
            istringstream in(data);
            xercesc::DOMDocument* doc = XMLToolingConfig::getConfig().getParser().parse(in);
            XercesJanitor<xercesc::DOMDocument> docjanitor(doc);
            XMLObject* xmlObject = XMLObjectBuilder::buildOneFromElement(doc->getDocumentElement(), true);
            if (!xmlObject) {
                throw DecodeException("No decoder available for metadata root element.");
            }
            docjanitor.release();
            return xmlObject;
        }
        catch (const XMLToolingException& ex) {
            throw DecodeException(string("Unable to decode metadata: ") + ex.what());
        }
        catch (const xercesc::XMLException& ex) {
            auto_ptr_char msg(ex.getMessage());
            throw DecodeException(string("Unable to decode metadata: ") + (msg.get() ? msg.get() : ""));
        }
    }

    UnexpectedRootException unexpectedRoot(const XMLObject& xmlObject, const char* expected)
    {
        const xmltooling::QName& q = xmlObject.getElementQName();
        auto_ptr_char ns(q.getNamespaceURI());
        auto_ptr_char name(q.getLocalPart());
        return UnexpectedRootException(
            SAML20MD_NS, expected, ns.get() ? ns.get() : "", name.get() ? name.get() : ""
            );
    }

    template <class T> void checkEndpoints(const vector<T*>& endpoints, const string& entityID)
    {
        for (typename vector<T*>::const_iterator ep = endpoints.begin(); ep != endpoints.end(); ++ep) {
            const XMLCh* binding = (*ep)->getBinding();
            const XMLCh* location = (*ep)->getLocation();
            if (!binding || !*binding || !location || !*location) {
                auto_ptr_char name((*ep)->getElementQName().getLocalPart());
                DecodeException ex(string("Endpoint (") + name.get() + ") requires Binding and Location attributes.");
                ex.addProperty(SPException::ENTITY_ID_PROP_NAME, entityID.c_str());
                throw ex;
            }
        }
    }

    /* Enforces the schema constraints the non-validating parser leaves unchecked. */
    void checkEntity(const saml2md::EntityDescriptor& entity)
    {
        string entityID = MetadataParser::getEntityID(entity);
        if (entityID.empty()) {
            throw DecodeException("EntityDescriptor is missing required entityID attribute.");
        }

        const vector<saml2md::IDPSSODescriptor*>& roles = entity.getIDPSSODescriptors();
        for (vector<saml2md::IDPSSODescriptor*>::const_iterator role = roles.begin(); role != roles.end(); ++role) {
            checkEndpoints((*role)->getSingleSignOnServices(), entityID);
            checkEndpoints((*role)->getSingleLogoutServices(), entityID);
        }
    }

    void checkEntities(const saml2md::EntitiesDescriptor& entities)
    {
        const vector<saml2md::EntityDescriptor*>& members = entities.getEntityDescriptors();
        for (vector<saml2md::EntityDescriptor*>::const_iterator i = members.begin(); i != members.end(); ++i) {
            checkEntity(**i);
        }
        const vector<saml2md::EntitiesDescriptor*>& groups = entities.getEntitiesDescriptors();
        for (vector<saml2md::EntitiesDescriptor*>::const_iterator i = groups.begin(); i != groups.end(); ++i) {
            checkEntities(**i);
        }
    }

    shared_ptr<const saml2md::EntityDescriptor> toEntityDescriptor(unique_ptr<XMLObject>& xmlObject)
    {
        saml2md::EntityDescriptor* entity = dynamic_cast<saml2md::EntityDescriptor*>(xmlObject.get());
        if (!entity) {
            throw unexpectedRoot(*xmlObject, "EntityDescriptor");
        }
        checkEntity(*entity);
        xmlObject.release();
        return shared_ptr<const saml2md::EntityDescriptor>(entity);
    }

    unique_ptr<saml2md::EntitiesDescriptor> toEntitiesDescriptor(unique_ptr<XMLObject>& xmlObject)
    {
        saml2md::EntitiesDescriptor* entities = dynamic_cast<saml2md::EntitiesDescriptor*>(xmlObject.get());
        if (!entities) {
            throw unexpectedRoot(*xmlObject, "EntitiesDescriptor");
        }
        checkEntities(*entities);
        xmlObject.release();
        return unique_ptr<saml2md::EntitiesDescriptor>(entities);
    }
};

string MetadataParser::getEntityID(const saml2md::EntityDescriptor& entity)
{
    auto_ptr_char id(entity.getEntityID());
    return id.get() ? id.get() : "";
}

shared_ptr<const saml2md::EntityDescriptor> MetadataParser::decodeEntityDescriptor(const string& data)
{
    unique_ptr<XMLObject> xmlObject(unmarshall(data));
    return toEntityDescriptor(xmlObject);
}

unique_ptr<saml2md::EntitiesDescriptor> MetadataParser::decodeEntitiesDescriptor(const string& data)
{
    unique_ptr<XMLObject> xmlObject(unmarshall(data));
    return toEntitiesDescriptor(xmlObject);
}

shared_ptr<const saml2md::EntityDescriptor> MetadataParser::parseIdPMetadata(const string& data, Category& log)
{
    unique_ptr<XMLObject> xmlObject(unmarshall(data));

    try {
        return toEntityDescriptor(xmlObject);
    }
    catch (const UnexpectedRootException& ex) {
        if (!ex.isActually(SAML20MD_NS, "EntitiesDescriptor")) {
            throw;
        }
    }

    log.debug("metadata root is an EntitiesDescriptor, searching for an IdP entity");

    unique_ptr<saml2md::EntitiesDescriptor> entities = toEntitiesDescriptor(xmlObject);
    const vector<saml2md::EntityDescriptor*>& members = entities->getEntityDescriptors();
    for (vector<saml2md::EntityDescriptor*>::const_iterator i = members.begin(); i != members.end(); ++i) {
        if (!(*i)->getIDPSSODescriptors().empty()) {
            log.debug("selected IdP entity (%s) from collection", getEntityID(**i).c_str());
            return shared_ptr<const saml2md::EntityDescriptor>((*i)->cloneEntityDescriptor());
        }
    }

    throw NoIdPEntityException("no entity found with IDPSSODescriptor");
}
