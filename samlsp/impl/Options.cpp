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
 * impl/Options.cpp
 *
 * Parameters for building a Middleware.
 */

#include "internal.h"
#include "exceptions.h"
#include "LibraryConfig.h"
#include "Middleware.h"
#include "Options.h"
#include "logging/Category.h"
#include "security/Credential.h"
#include "util/BoostPropertySet.h"
#include "util/PathResolver.h"

#include <stdexcept>

using namespace samlsp;
using namespace boost::property_tree;
using namespace std;

const char Options::BASE_URL_PROP_NAME[] =              "baseURL";
const char Options::KEY_FILE_PROP_NAME[] =              "keyFile";
const char Options::KEY_PASSWORD_PROP_NAME[] =          "keyPassword";
const char Options::CERTIFICATE_FILE_PROP_NAME[] =      "certificateFile";
const char Options::ALLOW_IDP_INITIATED_PROP_NAME[] =   "allowIDPInitiated";
const char Options::FORCE_AUTHN_PROP_NAME[] =           "forceAuthn";
const char Options::COOKIE_NAME_PROP_NAME[] =           "cookieName";
const char Options::COOKIE_MAX_AGE_PROP_NAME[] =        "cookieMaxAge";
const char Options::RETRY_COUNT_PROP_NAME[] =           "retryCount";
const char Options::RETRY_DELAY_PROP_NAME[] =           "retryDelay";
const char Options::IDP_METADATA_URL_PROP_NAME[] =      "idpMetadataURL";
const char Options::IDP_METADATA_FILE_PROP_NAME[] =     "idpMetadataFile";

namespace {
    URL parseURL(const char* name, const char* value)
    {
        try {
            return URL(value);
        }
        catch (const invalid_argument& e) {
            throw ConfigurationException(string("Invalid ") + name + " property: " + e.what());
        }
    }
};

Options::Options()
    : logger(nullptr), allowIDPInitiated(false), httpClient(nullptr), cookieMaxAge(0), forceAuthn(false)
{
}

Options::~Options()
{
}

void Options::load(const ptree& pt)
{
    Category& log = Category::getInstance(SAMLSP_LOGCAT ".Options");
    const PathResolver& resolver = LibraryConfig::getConfig().getPathResolver();

    BoostPropertySet props;
    props.load(pt);

    const char* val = props.getString(BASE_URL_PROP_NAME);
    if (val) {
        url = parseURL(BASE_URL_PROP_NAME, val);
    }

    val = props.getString(KEY_FILE_PROP_NAME);
    if (val) {
        string path(val);
        resolver.resolve(path, PathResolver::SAMLSP_CFG_FILE);
        log.debug("loading SP key from (%s)", path.c_str());
        key = PrivateKey::fromFile(path.c_str(), props.getString(KEY_PASSWORD_PROP_NAME));
    }

    val = props.getString(CERTIFICATE_FILE_PROP_NAME);
    if (val) {
        string path(val);
        resolver.resolve(path, PathResolver::SAMLSP_CFG_FILE);
        log.debug("loading SP certificate from (%s)", path.c_str());
        certificate = Certificate::fromFile(path.c_str());
    }

    allowIDPInitiated = props.getBool(ALLOW_IDP_INITIATED_PROP_NAME, allowIDPInitiated);
    forceAuthn = props.getBool(FORCE_AUTHN_PROP_NAME, forceAuthn);
    cookieName = props.getString(COOKIE_NAME_PROP_NAME, cookieName.c_str());
    cookieMaxAge = props.getUnsignedInt(COOKIE_MAX_AGE_PROP_NAME, cookieMaxAge);

    if (props.hasProperty(RETRY_COUNT_PROP_NAME)) {
        retryCount = props.getUnsignedInt(RETRY_COUNT_PROP_NAME, Middleware::DEFAULT_RETRY_COUNT);
    }
    if (props.hasProperty(RETRY_DELAY_PROP_NAME)) {
        retryDelay = chrono::milliseconds(1000 * static_cast<chrono::milliseconds::rep>(
            props.getUnsignedInt(RETRY_DELAY_PROP_NAME, Middleware::DEFAULT_RETRY_DELAY)));
    }

    val = props.getString(IDP_METADATA_URL_PROP_NAME);
    if (val && *val) {
        idpMetadataURL = parseURL(IDP_METADATA_URL_PROP_NAME, val);
    }

    val = props.getString(IDP_METADATA_FILE_PROP_NAME);
    if (val && *val) {
        idpMetadataFile = val;
        resolver.resolve(idpMetadataFile, PathResolver::SAMLSP_CFG_FILE);
    }
}
