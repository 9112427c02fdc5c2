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
 * @file samlsp/metadata/MetadataFetcher.h
 *
 * Retrieves remote metadata with a bounded number of retries.
 */

#ifndef __samlsp_mdfetcher_h__
#define __samlsp_mdfetcher_h__

#include <samlsp/base.h>

#include <chrono>
#include <string>

namespace samlsp {

    class SAMLSP_API CancellationToken;
    class SAMLSP_API Category;
    class SAMLSP_API HTTPClient;
    class SAMLSP_API URL;

    /**
     * Fetches a metadata document over HTTP.
     *
     * <p>One GET request is built per fetch and sent up to retryCount + 1 times.
     * Transport failures and non-200 responses are logged at warning level and
     * retried after a fixed delay; the last failure is rethrown once the
     * attempts are used up.</p>
     */
    class SAMLSP_API MetadataFetcher
    {
        MAKE_NONCOPYABLE(MetadataFetcher);
    public:
        /**
         * Constructor.
         *
         * @param client        HTTP client to send requests with
         * @param log           category for retry warnings
         * @param retryCount    number of retries after the first attempt
         * @param retryDelay    wait between attempts
         */
        MetadataFetcher(
            const HTTPClient& client,
            Category& log,
            unsigned int retryCount,
            std::chrono::milliseconds retryDelay
            );
        ~MetadataFetcher();

        /**
         * Fetches a document.
         *
         * <p>Raises TransportException (HTTPStatusException for a non-200 status)
         * when every attempt fails, and OperationException if the token is cancelled
         * first.</p>
         *
         * @param url   location of the document
         * @param token optional token to cancel the fetch between attempts
         * @return  the response body
         */
        std::string fetch(const URL& url, const CancellationToken* token=nullptr) const;

        /**
         * Returns the User-Agent header sent with each request.
         *
         * @return User-Agent value
         */
        static const char* getUserAgent();

    private:
        const HTTPClient& m_client;
        Category& m_log;
        unsigned int m_retryCount;
        std::chrono::milliseconds m_retryDelay;
    };

};

#endif /* __samlsp_mdfetcher_h__ */
