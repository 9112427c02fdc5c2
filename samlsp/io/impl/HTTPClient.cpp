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
 * io/impl/HTTPClient.cpp
 *
 * Outbound HTTP requests.
 */

#include "internal.h"

#include "LibraryConfig.h"
#include "io/HTTPClient.h"

#include <boost/property_tree/ptree.hpp>

using namespace samlsp;
using namespace boost::property_tree;
using namespace std;

namespace samlsp {
    extern HTTPClient* SAMLSP_DLLLOCAL CurlHTTPClientFactory(const ptree& pt, bool deprecationSupport);
};

void SAMLSP_API samlsp::registerHTTPClients()
{
    LibraryConfig::getConfig().HTTPClientManager.registerFactory(CURL_HTTP_CLIENT, CurlHTTPClientFactory);
}

HTTPClientRequest::HTTPClientRequest(const char* url) : m_url(url ? url : "")
{
}

HTTPClientRequest::~HTTPClientRequest()
{
}

const char* HTTPClientRequest::getMethod() const
{
    return "GET";
}

const char* HTTPClientRequest::getURL() const
{
    return m_url.c_str();
}

const char* HTTPClientRequest::getHeader(const char* name) const
{
    if (name) {
        map<string,string>::const_iterator i = m_headers.find(name);
        if (i != m_headers.end()) {
            return i->second.c_str();
        }
    }
    return nullptr;
}

void HTTPClientRequest::setHeader(const char* name, const char* value)
{
    if (name && *name) {
        m_headers[name] = value ? value : "";
    }
}

const map<string,string>& HTTPClientRequest::getHeaders() const
{
    return m_headers;
}

HTTPClient::HTTPClient()
{
}

HTTPClient::~HTTPClient()
{
}

const char* HTTPClient::getReasonPhrase(long status)
{
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
    }
    return "";
}
