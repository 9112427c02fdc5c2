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
 * metadata/impl/MetadataFetcher.cpp
 *
 * Retrieves remote metadata with a bounded number of retries.
 */

#include "internal.h"
#include "exceptions.h"
#include "io/HTTPClient.h"
#include "logging/Category.h"
#include "metadata/MetadataFetcher.h"
#include "util/CancellationToken.h"
#include "util/URL.h"

#include <sstream>
#include <thread>

using namespace samlsp;
using namespace std;

MetadataFetcher::MetadataFetcher(const HTTPClient& client, Category& log, unsigned int retryCount, chrono::milliseconds retryDelay)
    : m_client(client), m_log(log), m_retryCount(retryCount), m_retryDelay(retryDelay)
{
}

MetadataFetcher::~MetadataFetcher()
{
}

const char* MetadataFetcher::getUserAgent()
{
    static const string ua = string("C++; ") + PACKAGE_NAME + '/' + PACKAGE_VERSION;
    return ua.c_str();
}

string MetadataFetcher::fetch(const URL& url, const CancellationToken* token) const
{
    const string location(url.toString());

    HTTPClientRequest request(location.c_str());
    request.setHeader("User-Agent", getUserAgent());

    for (unsigned int attempt = 0; ; ++attempt) {
        if (token && token->isCancelled()) {
            throw OperationException("Metadata fetch from " + location + " was cancelled.");
        }

        try {
            m_log.debug("fetching metadata from %s (attempt %u of %u)", location.c_str(), attempt + 1, m_retryCount + 1);
            ostringstream body;
            long status = m_client.send(request, body);
            if (status != HTTPClient::SAMLSP_HTTP_STATUS_OK) {
                HTTPStatusException ex(status);
                ex.addProperty(SPException::URL_PROP_NAME, location.c_str());
                throw ex;
            }
            return body.str();
        }
        catch (const TransportException& ex) {
            if (attempt >= m_retryCount) {
                m_log.error("%s: %s", location.c_str(), ex.what());
                throw;
            }
            m_log.warn("%s: %s (will retry)", location.c_str(), ex.what());
        }

        if (token) {
            if (!token->waitFor(m_retryDelay)) {
                throw OperationException("Metadata fetch from " + location + " was cancelled.");
            }
        }
        else if (m_retryDelay.count() > 0) {
            this_thread::sleep_for(m_retryDelay);
        }
    }
}
