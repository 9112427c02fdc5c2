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
 * OptionsTests.cpp
 *
 * Unit tests for loading SP options from configuration.
 */

#include "exceptions.h"
#include "LibraryConfig.h"
#include "Options.h"
#include "security/Credential.h"

#include <boost/test/unit_test.hpp>

using namespace boost::property_tree;
using namespace samlsp;
using namespace std;

#define DATA_PATH "./data/"

struct Options_Fixture {
    Options_Fixture() : data_path(DATA_PATH) {
        LibraryConfig::getConfig().init((data_path + "sp.ini").c_str(), true);
    }
    ~Options_Fixture() {
        LibraryConfig::getConfig().term();
    }

    const ptree& section(const char* name) const {
        return LibraryConfig::getConfig().getConfiguration().get_child(name);
    }

    string data_path;
};

BOOST_AUTO_TEST_CASE(Options_defaults)
{
    Options opts;
    BOOST_CHECK(!opts.url.isAbsolute());
    BOOST_CHECK(!opts.key);
    BOOST_CHECK(!opts.certificate);
    BOOST_CHECK(opts.logger == nullptr);
    BOOST_CHECK(!opts.allowIDPInitiated);
    BOOST_CHECK(!opts.idpMetadata);
    BOOST_CHECK(!opts.idpMetadataURL);
    BOOST_CHECK(opts.idpMetadataFile.empty());
    BOOST_CHECK(opts.httpClient == nullptr);
    BOOST_CHECK_EQUAL(opts.cookieMaxAge, 0);
    BOOST_CHECK(opts.cookieName.empty());
    BOOST_CHECK(!opts.forceAuthn);
    BOOST_CHECK(!opts.retryCount);
    BOOST_CHECK(!opts.retryDelay);
}

BOOST_FIXTURE_TEST_CASE(Options_load, Options_Fixture)
{
    Options opts;
    opts.load(section("sp"));

    BOOST_CHECK_EQUAL(opts.url.toString(), "https://sp.example.org:8443/app");
    BOOST_REQUIRE(opts.key);
    BOOST_CHECK_EQUAL(opts.key->getAlgorithm(), "RSA");
    BOOST_REQUIRE(opts.certificate);
    BOOST_CHECK_EQUAL(opts.certificate->getSubject(), "CN=sp.example.org");
    BOOST_CHECK(opts.allowIDPInitiated);
    BOOST_CHECK(opts.forceAuthn);
    BOOST_CHECK_EQUAL(opts.cookieName, "samlsession");
    BOOST_CHECK_EQUAL(opts.cookieMaxAge, 7200);
    BOOST_REQUIRE(opts.retryCount);
    BOOST_CHECK_EQUAL(opts.retryCount.get(), 2);
    BOOST_REQUIRE(opts.retryDelay);
    BOOST_CHECK(opts.retryDelay.get() == chrono::milliseconds(0));
    BOOST_CHECK(!opts.idpMetadataURL);
    BOOST_CHECK_EQUAL(opts.idpMetadataFile, "./data/metadata/idp.xml");
}

BOOST_FIXTURE_TEST_CASE(Options_load_partial, Options_Fixture)
{
    Options opts;
    opts.cookieName = "mine";
    opts.cookieMaxAge = 60;
    opts.allowIDPInitiated = true;
    opts.idpMetadataURL = URL("https://idp.example.org/metadata");

    opts.load(section("sp-encrypted"));

    // Key material from an encrypted PEM key and a DER certificate.
    BOOST_CHECK_EQUAL(opts.url.toString(), "http://localhost:8000");
    BOOST_REQUIRE(opts.key);
    BOOST_REQUIRE(opts.certificate);
    BOOST_CHECK(opts.certificate->matches(*opts.key));

    // Anything absent from the section is left as it was.
    BOOST_CHECK_EQUAL(opts.cookieName, "mine");
    BOOST_CHECK_EQUAL(opts.cookieMaxAge, 60);
    BOOST_CHECK(opts.allowIDPInitiated);
    BOOST_REQUIRE(opts.idpMetadataURL);
    BOOST_CHECK_EQUAL(opts.idpMetadataURL->toString(), "https://idp.example.org/metadata");
    BOOST_CHECK(!opts.retryCount);
    BOOST_CHECK(!opts.retryDelay);
}

BOOST_FIXTURE_TEST_CASE(Options_load_invalid, Options_Fixture)
{
    Options opts;
    BOOST_CHECK_THROW(opts.load(section("sp-badurl")), ConfigurationException);
    BOOST_CHECK_THROW(opts.load(section("sp-badmdurl")), ConfigurationException);
    BOOST_CHECK_THROW(opts.load(section("sp-missingkey")), IOException);
}

BOOST_FIXTURE_TEST_CASE(Options_load_bad_numbers, Options_Fixture)
{
    Options opts;
    opts.load(section("sp-badnumbers"));

    // Unusable numbers fall back to the defaults.
    BOOST_CHECK_EQUAL(opts.cookieMaxAge, 0);
    BOOST_REQUIRE(opts.retryCount);
    BOOST_CHECK_EQUAL(opts.retryCount.get(), 10);
}
