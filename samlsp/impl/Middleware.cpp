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
 * impl/Middleware.cpp
 *
 * Fully resolved SP configuration with its trusted IdPs.
 */

#include "internal.h"
#include "exceptions.h"
#include "LibraryConfig.h"
#include "Middleware.h"
#include "Options.h"
#include "io/HTTPClient.h"
#include "logging/Category.h"
#include "metadata/MetadataFetcher.h"
#include "metadata/MetadataParser.h"
#include "security/Credential.h"
#include "util/Misc.h"

using namespace samlsp;
using namespace std;

const char Middleware::METADATA_PATH[] = "/saml/metadata";
const char Middleware::ACS_PATH[] = "/saml/acs";
const char Middleware::DEFAULT_COOKIE_NAME[] = "token";
const unsigned int Middleware::DEFAULT_COOKIE_MAX_AGE = 3600;
const unsigned int Middleware::DEFAULT_RETRY_COUNT = 10;
const unsigned int Middleware::DEFAULT_RETRY_DELAY = 5;

namespace {
    const URL& checkBaseURL(const URL& url)
    {
        if (!url.isAbsolute()) {
            throw ConfigurationException("SP base URL must be an absolute URL with a host.");
        }
        if (url.getScheme() != "http" && url.getScheme() != "https") {
            throw ConfigurationException("SP base URL must use the http or https scheme.");
        }
        return url;
    }
};

Middleware::Middleware(const Options& opts, const CancellationToken* token)
    : m_log(opts.logger ? *opts.logger : Category::getInstance(SAMLSP_LOGCAT ".Middleware")),
        m_sp(
            opts.key,
            opts.certificate,
            m_log,
            checkBaseURL(opts.url).appendPath(METADATA_PATH),
            opts.url.appendPath(ACS_PATH),
            opts.idpMetadata,
            boost::logic::tribool(opts.forceAuthn)
            ),
        m_allowIDPInitiated(opts.allowIDPInitiated),
        m_cookieName(opts.cookieName.empty() ? DEFAULT_COOKIE_NAME : opts.cookieName),
        m_cookieMaxAge(opts.cookieMaxAge ? opts.cookieMaxAge : DEFAULT_COOKIE_MAX_AGE),
        m_cookieDomain(opts.url.getHost()),
        m_retryCount(opts.retryCount ? opts.retryCount.get() : DEFAULT_RETRY_COUNT),
        m_retryDelay(opts.retryDelay ? opts.retryDelay.get() : chrono::milliseconds(1000 * DEFAULT_RETRY_DELAY))
{
    if (!opts.certificate->matches(*opts.key)) {
        m_log.warn("SP certificate (%s) does not match the SP private key", opts.certificate->getSubject().c_str());
    }

    m_log.info("SP configured with metadata URL (%s), ACS URL (%s)",
        m_sp.getMetadataURL().toString().c_str(), m_sp.getAcsURL().toString().c_str());

    if (!opts.idpMetadataFile.empty()) {
        m_log.info("loading IdP metadata from (%s)", opts.idpMetadataFile.c_str());
        addIDPMetadata(FileSupport::read(opts.idpMetadataFile.c_str()));
    }

    if (opts.idpMetadataURL) {
        fetchIDPMetadata(opts.httpClient, opts.idpMetadataURL.get(), token);
    }
}

Middleware::~Middleware()
{
}

void Middleware::addIDPMetadata(const string& data)
{
    m_sp.addIDPMetadata(MetadataParser::parseIdPMetadata(data, m_log));
}

void Middleware::fetchIDPMetadata(const HTTPClient* client, const URL& url, const CancellationToken* token)
{
    MetadataFetcher fetcher(
        client ? *client : LibraryConfig::getConfig().getHTTPClient(), m_log, m_retryCount, m_retryDelay
        );
    addIDPMetadata(fetcher.fetch(url, token));
}
