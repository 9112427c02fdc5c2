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
 * metadata/impl/IdPRegistryTests.cpp
 *
 * Unit tests for the IdP registry.
 */

#include "LibraryConfig.h"
#include "metadata/IdPRegistry.h"
#include "metadata/MetadataParser.h"
#include "util/Misc.h"

#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include <saml/saml2/metadata/Metadata.h>

using namespace samlsp;
using namespace opensaml;
using namespace std;

#define DATA_PATH "./data/metadata/"

struct Registry_Fixture {
    Registry_Fixture() : data_path(DATA_PATH) {
        LibraryConfig::getConfig().init("./data/console.ini", true);
    }
    ~Registry_Fixture() {
        LibraryConfig::getConfig().term();
    }

    shared_ptr<const saml2md::EntityDescriptor> load(const char* file) const {
        return MetadataParser::decodeEntityDescriptor(FileSupport::read((data_path + file).c_str()));
    }

    string data_path;
};

BOOST_FIXTURE_TEST_CASE(IdPRegistry_empty, Registry_Fixture)
{
    IdPRegistry registry;
    BOOST_CHECK_EQUAL(registry.size(), 0);
    BOOST_CHECK(!registry.get("https://idp.example.org/idp/shibboleth"));
    BOOST_CHECK(!registry.get(nullptr));
    BOOST_CHECK(registry.getEntityIDs().empty());

    BOOST_CHECK_THROW(registry.add(shared_ptr<const saml2md::EntityDescriptor>()), invalid_argument);
    BOOST_CHECK_EQUAL(registry.size(), 0);
}

BOOST_FIXTURE_TEST_CASE(IdPRegistry_add, Registry_Fixture)
{
    shared_ptr<const saml2md::EntityDescriptor> idp1 = load("idp.xml");
    shared_ptr<const saml2md::EntityDescriptor> idp2 = load("idp-default-ns.xml");

    IdPRegistry registry;
    registry.add(idp2);
    BOOST_CHECK_EQUAL(registry.size(), 1);
    BOOST_CHECK_EQUAL(registry.get("https://idp2.example.org/saml"), idp2);

    registry.add(idp1);
    BOOST_CHECK_EQUAL(registry.size(), 2);
    BOOST_CHECK_EQUAL(registry.get("https://idp.example.org/idp/shibboleth"), idp1);
    BOOST_CHECK_EQUAL(registry.get("https://idp2.example.org/saml"), idp2);
    BOOST_CHECK(!registry.get("https://idp3.example.org/idp"));

    vector<string> ids = registry.getEntityIDs();
    BOOST_REQUIRE_EQUAL(ids.size(), 2);
    BOOST_CHECK_EQUAL(ids[0], "https://idp.example.org/idp/shibboleth");
    BOOST_CHECK_EQUAL(ids[1], "https://idp2.example.org/saml");
}

BOOST_FIXTURE_TEST_CASE(IdPRegistry_replace, Registry_Fixture)
{
    shared_ptr<const saml2md::EntityDescriptor> first = load("idp.xml");
    shared_ptr<const saml2md::EntityDescriptor> other = load("idp-default-ns.xml");
    shared_ptr<const saml2md::EntityDescriptor> second = load("idp.xml");
    BOOST_CHECK_NE(first, second);

    IdPRegistry registry;
    registry.add(first);
    registry.add(other);

    // Same entityID: replaced in place.
    registry.add(second);
    BOOST_CHECK_EQUAL(registry.size(), 2);
    BOOST_CHECK_EQUAL(registry.get("https://idp.example.org/idp/shibboleth"), second);
    BOOST_CHECK_EQUAL(registry.get("https://idp2.example.org/saml"), other);

    // Re-adding an existing entity changes nothing.
    registry.add(other);
    BOOST_CHECK_EQUAL(registry.size(), 2);
    BOOST_CHECK_EQUAL(registry.get("https://idp2.example.org/saml"), other);
}
