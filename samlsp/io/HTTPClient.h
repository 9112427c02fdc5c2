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
 * @file samlsp/io/HTTPClient.h
 *
 * Outbound HTTP requests.
 */

#ifndef __samlsp_httpclient_h__
#define __samlsp_httpclient_h__

#include <samlsp/base.h>

#include <iostream>
#include <map>
#include <string>

namespace samlsp {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * An outbound HTTP GET request.
     *
     * <p>Header names are stored as supplied; a second value for the same name
     * replaces the first.</p>
     */
    class SAMLSP_API HTTPClientRequest
    {
    public:
        /**
         * Constructor.
         *
         * @param url   absolute URL to request
         */
        HTTPClientRequest(const char* url);
        virtual ~HTTPClientRequest();

        /**
         * Returns the HTTP method, always "GET".
         *
         * @return the HTTP method
         */
        const char* getMethod() const;

        /**
         * Returns the URL to request.
         *
         * @return the request URL
         */
        const char* getURL() const;

        /**
         * Returns a request header.
         *
         * @param name  header name
         * @return  the header value or null
         */
        const char* getHeader(const char* name) const;

        /**
         * Sets a request header.
         *
         * @param name  header name
         * @param value header value
         */
        void setHeader(const char* name, const char* value);

        /**
         * Returns all request headers.
         *
         * @return header map
         */
        const std::map<std::string,std::string>& getHeaders() const;

    private:
        std::string m_url;
        std::map<std::string,std::string> m_headers;
    };

    /**
     * Interface to an HTTP client implementation.
     */
    class SAMLSP_API HTTPClient
    {
        MAKE_NONCOPYABLE(HTTPClient);
    protected:
        HTTPClient();
    public:
        virtual ~HTTPClient();

        /** Some common HTTP status codes. */
        enum status_t {
            SAMLSP_HTTP_STATUS_OK = 200,
            SAMLSP_HTTP_STATUS_MOVED = 302,
            SAMLSP_HTTP_STATUS_NOTMODIFIED = 304,
            SAMLSP_HTTP_STATUS_UNAUTHORIZED = 401,
            SAMLSP_HTTP_STATUS_FORBIDDEN = 403,
            SAMLSP_HTTP_STATUS_NOTFOUND = 404,
            SAMLSP_HTTP_STATUS_ERROR = 500,
            SAMLSP_HTTP_STATUS_BADGATEWAY = 502,
            SAMLSP_HTTP_STATUS_UNAVAILABLE = 503
        };

        /**
         * Performs a request and copies the response body to an output stream.
         *
         * <p>Any HTTP status is a successful exchange; only transport-level failures
         * (connection, TLS, timeout) raise TransportException.</p>
         *
         * @param request   the request to issue
         * @param output    stream to receive the response body
         * @return  the HTTP status code of the response
         */
        virtual long send(const HTTPClientRequest& request, std::ostream& output) const=0;

        /**
         * Returns the standard reason phrase for a status code.
         *
         * @param status    HTTP status code
         * @return  the reason phrase, or an empty string for unknown codes
         */
        static const char* getReasonPhrase(long status);
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

    /**
     * Registers HTTPClient classes into the runtime.
     */
    void SAMLSP_API registerHTTPClients();

    /** HTTPClient based on libcurl. */
    #define CURL_HTTP_CLIENT "curl"
};

#endif /* __samlsp_httpclient_h__ */
