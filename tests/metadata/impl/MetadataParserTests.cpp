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
 * metadata/impl/MetadataParserTests.cpp
 *
 * Unit tests for metadata decoding and IdP selection.
 */

#include "exceptions.h"
#include "LibraryConfig.h"
#include "logging/Category.h"
#include "metadata/MetadataParser.h"
#include "util/Misc.h"
#include "util/SPConstants.h"

#include <cstdio>
#include <cstring>
#include <boost/algorithm/string.hpp>
#include <boost/test/unit_test.hpp>
#include <saml/saml2/metadata/EndpointManager.h>
#include <saml/saml2/metadata/Metadata.h>
#include <saml/util/SAMLConstants.h>
#include <xmltooling/signature/KeyInfo.h>
#include <xmltooling/unicode.h>

using namespace samlsp;
using namespace samlspconstants;
using namespace opensaml;
using namespace std;

#define DATA_PATH "./data/metadata/"
#define LOG_FILE "./samlsp-test.log"

#define SAML20_BINDING_REDIRECT "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-Redirect"
#define SAML20_BINDING_POST "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-POST"

struct Parser_Fixture {
    Parser_Fixture(const char* config="console.ini") : data_path(DATA_PATH) {
        LibraryConfig::getConfig().init((string("./data/") + config).c_str(), true);
    }
    ~Parser_Fixture() {
        LibraryConfig::getConfig().term();
    }

    string read(const char* file) const {
        return FileSupport::read((data_path + file).c_str());
    }

    string data_path;
};

struct ParserLog_Fixture : public Parser_Fixture {
    ParserLog_Fixture() : Parser_Fixture("file-logging.ini") {}
    ~ParserLog_Fixture() {
        remove(LOG_FILE);
    }
};

namespace {
    class exceptionCheck {
    public:
        exceptionCheck(const string& msg) : m_msg(msg) {}
        bool check_message(const exception& e) {
            return strstr(e.what(), m_msg.c_str()) != nullptr;
        }
    private:
        string m_msg;
    };

    string str(const XMLCh* s) {
        xmltooling::auto_ptr_char narrow(s);
        return narrow.get() ? narrow.get() : "";
    }

    Category& log() {
        return Category::getInstance(SAMLSP_LOGCAT ".MetadataParser");
    }
};

BOOST_FIXTURE_TEST_CASE(MetadataParser_entity, Parser_Fixture)
{
    shared_ptr<const saml2md::EntityDescriptor> entity = MetadataParser::decodeEntityDescriptor(read("idp.xml"));
    BOOST_REQUIRE(entity);

    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(*entity), "https://idp.example.org/idp/shibboleth");
    BOOST_CHECK_EQUAL(str(entity->getID()), "_idp1");
    BOOST_REQUIRE(entity->getValidUntil());
    BOOST_CHECK_EQUAL(entity->getValidUntilEpoch(), 2082758400);
    BOOST_REQUIRE(entity->getCacheDuration());
    BOOST_CHECK_EQUAL(entity->getCacheDurationEpoch(), 6 * 60 * 60);
    BOOST_CHECK(entity->getSPSSODescriptors().empty());
    BOOST_REQUIRE_EQUAL(entity->getIDPSSODescriptors().size(), 1);

    xmltooling::auto_ptr_XMLCh saml11("urn:oasis:names:tc:SAML:1.1:protocol");
    BOOST_CHECK(entity->getIDPSSODescriptor(saml11.get()) == nullptr);
    const saml2md::IDPSSODescriptor* idp = entity->getIDPSSODescriptor(samlconstants::SAML20P_NS);
    BOOST_REQUIRE(idp);
    BOOST_CHECK(idp->WantAuthnRequestsSigned());
    BOOST_CHECK(idp->getErrorURL() == nullptr);

    BOOST_REQUIRE_EQUAL(idp->getKeyDescriptors().size(), 2);
    const saml2md::KeyDescriptor* signing = idp->getKeyDescriptors()[0];
    BOOST_CHECK_EQUAL(str(signing->getUse()), "signing");
    BOOST_REQUIRE(signing->getKeyInfo());
    BOOST_REQUIRE_EQUAL(signing->getKeyInfo()->getX509Datas().size(), 1);
    BOOST_REQUIRE_EQUAL(signing->getKeyInfo()->getX509Datas().front()->getX509Certificates().size(), 1);
    string cert = boost::trim_copy(str(signing->getKeyInfo()->getX509Datas().front()->getX509Certificates().front()->getValue()));
    BOOST_CHECK_EQUAL(cert.substr(0, 3), "MII");
    const saml2md::KeyDescriptor* named = idp->getKeyDescriptors()[1];
    BOOST_CHECK(named->getUse() == nullptr);
    BOOST_REQUIRE(named->getKeyInfo());
    BOOST_CHECK(named->getKeyInfo()->getX509Datas().empty());
    BOOST_CHECK_EQUAL(named->getKeyInfo()->getKeyNames().size(), 1);

    BOOST_REQUIRE_EQUAL(idp->getSingleSignOnServices().size(), 2);
    BOOST_REQUIRE_EQUAL(idp->getSingleLogoutServices().size(), 1);
    BOOST_CHECK_EQUAL(str(idp->getSingleLogoutServices()[0]->getBinding()), SAML20_BINDING_REDIRECT);

    saml2md::EndpointManager<saml2md::SingleSignOnService> endpoints(idp->getSingleSignOnServices());
    xmltooling::auto_ptr_XMLCh post(SAML20_BINDING_POST);
    const saml2md::SingleSignOnService* sso = endpoints.getByBinding(post.get());
    BOOST_REQUIRE(sso);
    BOOST_CHECK_EQUAL(str(sso->getLocation()), "https://idp.example.org/idp/profile/SAML2/POST/SSO");
    BOOST_CHECK(sso->getResponseLocation() == nullptr);
    xmltooling::auto_ptr_XMLCh soap("urn:oasis:names:tc:SAML:2.0:bindings:SOAP");
    BOOST_CHECK(endpoints.getByBinding(soap.get()) == nullptr);

    BOOST_REQUIRE_EQUAL(idp->getNameIDFormats().size(), 2);
    BOOST_CHECK_EQUAL(str(idp->getNameIDFormats()[0]->getFormat()), "urn:oasis:names:tc:SAML:2.0:nameid-format:transient");
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_entity_default_namespace, Parser_Fixture)
{
    shared_ptr<const saml2md::EntityDescriptor> entity = MetadataParser::decodeEntityDescriptor(read("idp-default-ns.xml"));
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(*entity), "https://idp2.example.org/saml");
    BOOST_CHECK(entity->getValidUntil() == nullptr);
    BOOST_CHECK(entity->getCacheDuration() == nullptr);
    const saml2md::IDPSSODescriptor* idp = entity->getIDPSSODescriptor(samlconstants::SAML20P_NS);
    BOOST_REQUIRE(idp);
    BOOST_CHECK(!idp->WantAuthnRequestsSigned());
    BOOST_CHECK_EQUAL(idp->getSingleSignOnServices().size(), 1);
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_entity_validuntil_zones, Parser_Fixture)
{
    // 2030-01-01T00:00:00Z
    const time_t midnight = 1893456000;

    shared_ptr<const saml2md::EntityDescriptor> entity = MetadataParser::decodeEntityDescriptor(read("validuntil-offset.xml"));
    BOOST_CHECK_EQUAL(entity->getValidUntilEpoch(), midnight - 60 * 60);

    entity = MetadataParser::decodeEntityDescriptor(read("validuntil-utc-offset.xml"));
    BOOST_CHECK_EQUAL(entity->getValidUntilEpoch(), midnight);

    // No zone designator means UTC.
    entity = MetadataParser::decodeEntityDescriptor(read("validuntil-nozone.xml"));
    BOOST_CHECK_EQUAL(entity->getValidUntilEpoch(), midnight);
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_entity_invalid, Parser_Fixture)
{
    exceptionCheck checker_entityid("missing required entityID");
    BOOST_CHECK_EXCEPTION(MetadataParser::decodeEntityDescriptor(read("missing-entityid.xml")),
        DecodeException, checker_entityid.check_message);

    exceptionCheck checker_validuntil("Unable to decode metadata");
    BOOST_CHECK_EXCEPTION(MetadataParser::decodeEntityDescriptor(read("bad-validuntil.xml")),
        DecodeException, checker_validuntil.check_message);

    try {
        MetadataParser::decodeEntityDescriptor(read("bad-endpoint.xml"));
        BOOST_FAIL("endpoint without a Location accepted");
    }
    catch (const DecodeException& ex) {
        BOOST_CHECK(strstr(ex.what(), "requires Binding and Location") != nullptr);
        BOOST_REQUIRE(ex.getProperty(SPException::ENTITY_ID_PROP_NAME));
        BOOST_CHECK_EQUAL(ex.getProperty(SPException::ENTITY_ID_PROP_NAME), "https://idp4.example.org/idp");
        BOOST_CHECK_EQUAL(ex.getProperties().size(), 1);
    }

    BOOST_CHECK_THROW(MetadataParser::decodeEntityDescriptor(read("malformed.xml")), DecodeException);
    BOOST_CHECK_THROW(MetadataParser::decodeEntityDescriptor(""), DecodeException);
    BOOST_CHECK_THROW(MetadataParser::decodeEntityDescriptor("not xml at all"), DecodeException);
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_entity_wrong_root, Parser_Fixture)
{
    try {
        MetadataParser::decodeEntityDescriptor(read("entities-second-idp.xml"));
        BOOST_FAIL("collection decoded as an entity");
    }
    catch (const UnexpectedRootException& ex) {
        BOOST_CHECK_EQUAL(ex.getExpectedNamespace(), SAML20MD_NS);
        BOOST_CHECK_EQUAL(ex.getExpectedName(), "EntityDescriptor");
        BOOST_CHECK_EQUAL(ex.getActualNamespace(), SAML20MD_NS);
        BOOST_CHECK_EQUAL(ex.getActualName(), "EntitiesDescriptor");
        BOOST_CHECK(ex.isActually(SAML20MD_NS, "EntitiesDescriptor"));
        BOOST_CHECK_EQUAL(ex.what(), "expected element type <EntityDescriptor> but have <EntitiesDescriptor>");
    }

    try {
        MetadataParser::decodeEntityDescriptor(read("wrong-namespace.xml"));
        BOOST_FAIL("element in a foreign namespace decoded as an entity");
    }
    catch (const UnexpectedRootException& ex) {
        BOOST_CHECK_EQUAL(ex.getActualNamespace(), "urn:example:not-metadata");
        BOOST_CHECK_EQUAL(ex.getActualName(), "EntityDescriptor");
        BOOST_CHECK(!ex.isActually(SAML20MD_NS, "EntityDescriptor"));
    }

    BOOST_CHECK_THROW(MetadataParser::decodeEntitiesDescriptor(read("idp.xml")), UnexpectedRootException);
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_entities, Parser_Fixture)
{
    unique_ptr<saml2md::EntitiesDescriptor> entities = MetadataParser::decodeEntitiesDescriptor(read("entities-second-idp.xml"));
    BOOST_CHECK_EQUAL(str(entities->getName()), "urn:example:federation");
    BOOST_REQUIRE_EQUAL(entities->getEntityDescriptors().size(), 2);

    const saml2md::EntityDescriptor& sp = *entities->getEntityDescriptors()[0];
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(sp), "https://sp.example.org/shibboleth");
    BOOST_CHECK_EQUAL(sp.getSPSSODescriptors().size(), 1);
    BOOST_CHECK(sp.getIDPSSODescriptors().empty());

    // Members with their own prefix for the metadata namespace.
    const saml2md::EntityDescriptor& idp = *entities->getEntityDescriptors()[1];
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(idp), "https://idp3.example.org/idp");
    BOOST_CHECK(!idp.getIDPSSODescriptors().empty());

    BOOST_CHECK_THROW(MetadataParser::decodeEntitiesDescriptor(read("entities-bad-member.xml")), DecodeException);
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_idp_single, Parser_Fixture)
{
    shared_ptr<const saml2md::EntityDescriptor> entity = MetadataParser::parseIdPMetadata(read("idp.xml"), log());
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(*entity), "https://idp.example.org/idp/shibboleth");
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_idp_from_collection, Parser_Fixture)
{
    shared_ptr<const saml2md::EntityDescriptor> entity = MetadataParser::parseIdPMetadata(read("entities-second-idp.xml"), log());
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(*entity), "https://idp3.example.org/idp");
    BOOST_REQUIRE(entity->getIDPSSODescriptor(samlconstants::SAML20P_NS));

    // The first qualifying member wins.
    entity = MetadataParser::parseIdPMetadata(read("entities-two-idps.xml"), log());
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(*entity), "https://first.example.org/idp");

    // A member ahead of the IdP with an offset validUntil does not block selection.
    entity = MetadataParser::parseIdPMetadata(read("entities-offset-member.xml"), log());
    BOOST_CHECK_EQUAL(MetadataParser::getEntityID(*entity), "https://idp6.example.org/idp");
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_idp_none, Parser_Fixture)
{
    exceptionCheck checker("no entity found with IDPSSODescriptor");
    BOOST_CHECK_EXCEPTION(MetadataParser::parseIdPMetadata(read("entities-no-idp.xml"), log()),
        NoIdPEntityException, checker.check_message);
    BOOST_CHECK_THROW(MetadataParser::parseIdPMetadata(read("entities-no-idp.xml"), log()), MetadataException);
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_idp_errors, Parser_Fixture)
{
    // Failures other than a collection root surface unchanged.
    BOOST_CHECK_THROW(MetadataParser::parseIdPMetadata(read("missing-entityid.xml"), log()), DecodeException);
    BOOST_CHECK_THROW(MetadataParser::parseIdPMetadata(read("malformed.xml"), log()), DecodeException);
    BOOST_CHECK_THROW(MetadataParser::parseIdPMetadata(read("wrong-namespace.xml"), log()), UnexpectedRootException);

    try {
        MetadataParser::parseIdPMetadata(read("affiliation.xml"), log());
        BOOST_FAIL("AffiliationDescriptor accepted as IdP metadata");
    }
    catch (const UnexpectedRootException& ex) {
        BOOST_CHECK_EQUAL(ex.getActualName(), "AffiliationDescriptor");
    }

    // A broken collection member is a decoding failure, not a missing IdP.
    try {
        MetadataParser::parseIdPMetadata(read("entities-bad-member.xml"), log());
        BOOST_FAIL("collection with an invalid member accepted");
    }
    catch (const NoIdPEntityException&) {
        BOOST_FAIL("invalid member reported as a missing IdP");
    }
    catch (const DecodeException& ex) {
        BOOST_CHECK(strstr(ex.what(), "entityID") != nullptr);
    }
}

BOOST_FIXTURE_TEST_CASE(MetadataParser_idp_logs_to_caller_category, ParserLog_Fixture)
{
    Category& caller = Category::getInstance(SAMLSP_LOGCAT ".Middleware.Test");
    shared_ptr<const saml2md::EntityDescriptor> entity = MetadataParser::parseIdPMetadata(read("entities-second-idp.xml"), caller);
    BOOST_REQUIRE(entity);

    string content = FileSupport::read(LOG_FILE);
    BOOST_CHECK(content.find(
        "DEBUG [" SAMLSP_LOGCAT ".Middleware.Test] - selected IdP entity (https://idp3.example.org/idp) from collection"
        ) != string::npos);
}
