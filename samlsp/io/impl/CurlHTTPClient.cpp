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
 * io/impl/CurlHTTPClient.cpp
 *
 * HTTPClient based on libcurl.
 */

#include "internal.h"
#include "exceptions.h"

#include "LibraryConfig.h"
#include "io/HTTPClient.h"
#include "logging/Category.h"
#include "util/BoostPropertySet.h"
#include "util/PathResolver.h"

#include <sys/stat.h>

#include <cctype>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <boost/property_tree/ptree.hpp>
#include <curl/curl.h>

using namespace samlsp;
using namespace boost::property_tree;
using namespace std;

namespace {

    class SAMLSP_DLLLOCAL CurlHTTPClient : public HTTPClient {
    public:
        CurlHTTPClient(const ptree& pt);
        virtual ~CurlHTTPClient();

        long send(const HTTPClientRequest& request, ostream& output) const;

        Category& logger() const {
            return m_log;
        }

        CURL* newHandle() const;

    private:
        Category& m_log;
        mutable ofstream m_traceFile;
        mutable mutex m_traceLock;
        bool m_curlInit;
        string m_userAgent;
        string m_caFile;
        string m_ciphers;
        unsigned int m_connectTimeout;
        unsigned int m_timeout;
        unsigned int m_maxRedirects;
    };

    /* Owns the handle and header list for a single exchange. */
    class SAMLSP_DLLLOCAL CurlOperation
    {
        MAKE_NONCOPYABLE(CurlOperation);
    public:
        CurlOperation(const CurlHTTPClient& client) : m_client(client), m_handle(nullptr), m_headers(nullptr) {
            m_handle = client.newHandle();
            if (!m_handle) {
                throw TransportException("Unable to obtain a libcurl handle.");
            }
        }

        ~CurlOperation() {
            curl_slist_free_all(m_headers);
            curl_easy_cleanup(m_handle);
        }

        void setRequestHeader(const char* name, const char* val) {
            string temp(name);
            temp = temp + ": " + val;
            m_headers = curl_slist_append(m_headers, temp.c_str());
        }

        long send(const char* url, ostream& out);

    private:
        const CurlHTTPClient& m_client;
        CURL* m_handle;
        struct curl_slist* m_headers;
    };

    // callback to buffer data from server
    size_t curl_write_hook(void* ptr, size_t size, size_t nmemb, void* stream) {
        size_t len = size * nmemb;
        ostream* out = reinterpret_cast<ostream*>(stream);
        out->write(reinterpret_cast<const char*>(ptr), len);
        // A short count aborts the transfer with CURLE_WRITE_ERROR.
        return *out ? len : 0;
    }

    // callback for curl debug data
    int curl_debug_hook(CURL* handle, curl_infotype type, char* data, size_t len, void* ptr) {
        if (ptr) {
            string buf;
            for (unsigned char* ch = (unsigned char*)data; len && (isprint(*ch) || isspace(*ch)); len--) {
                buf += *ch++;
            }
            *(reinterpret_cast<ofstream*>(ptr)) << buf;
        }
        return 0;
    }

};

namespace samlsp {
    HTTPClient* SAMLSP_DLLLOCAL CurlHTTPClientFactory(const ptree& pt, bool deprecationSupport) {
        return new CurlHTTPClient(pt);
    }
};

CurlHTTPClient::CurlHTTPClient(const ptree& pt)
    : m_log(Category::getInstance(SAMLSP_LOGCAT ".HTTPClient.Curl")), m_curlInit(false),
        m_connectTimeout(3), m_timeout(10), m_maxRedirects(10)
{
    static const char USER_AGENT_PROP_NAME[] = "userAgent";
    static const char CONNECT_TIMEOUT_PROP_NAME[] = "connectTimeout";
    static const char TIMEOUT_PROP_NAME[] = "timeout";
    static const char MAX_REDIRECTS_PROP_NAME[] = "maxRedirects";
    static const char CA_FILE_PROP_NAME[] = "tlsCAFile";
    static const char CIPHER_LIST_PROP_NAME[] = "tlsCipherList";
    static const char TRACE_FILE_PROP_NAME[] = "traceFile";

    CURLcode status = curl_global_init(CURL_GLOBAL_ALL);
    if (status != CURLE_OK) {
        m_log.crit("libcurl initialization failure: %d", status);
        throw runtime_error("libcurl failed to initialize");
    }
    m_curlInit = true;

    BoostPropertySet props;
    props.load(pt);

    m_connectTimeout = props.getUnsignedInt(CONNECT_TIMEOUT_PROP_NAME, m_connectTimeout);
    m_timeout = props.getUnsignedInt(TIMEOUT_PROP_NAME, m_timeout);
    m_maxRedirects = props.getUnsignedInt(MAX_REDIRECTS_PROP_NAME, m_maxRedirects);
    m_ciphers = props.getString(CIPHER_LIST_PROP_NAME, "");
    m_userAgent = props.getString(USER_AGENT_PROP_NAME, "");
    if (m_userAgent.empty()) {
        m_userAgent = string(PACKAGE_NAME) + '/' + PACKAGE_VERSION;
        curl_version_info_data* curlver = curl_version_info(CURLVERSION_NOW);
        if (curlver) {
            m_userAgent = m_userAgent + " libcurl/" + curlver->version;
            if (curlver->ssl_version) {
                m_userAgent = m_userAgent + ' ' + curlver->ssl_version;
            }
        }
    }

    m_caFile = props.getString(CA_FILE_PROP_NAME, "");
    if (!m_caFile.empty()) {
        LibraryConfig::getConfig().getPathResolver().resolve(m_caFile, PathResolver::SAMLSP_CFG_FILE);
        struct stat stat_buf;
        if (stat(m_caFile.c_str(), &stat_buf) != 0) {
            curl_global_cleanup();
            throw ConfigurationException(string("Unable to access CA file: ") + m_caFile);
        }
        else if (stat_buf.st_size == 0) {
            curl_global_cleanup();
            throw ConfigurationException(string("CA file is empty: ") + m_caFile);
        }
    }

    string tracefile = props.getString(TRACE_FILE_PROP_NAME, "");
    if (!tracefile.empty()) {
        LibraryConfig::getConfig().getPathResolver().resolve(tracefile, PathResolver::SAMLSP_LOG_FILE);
        m_traceFile.open(tracefile, ios_base::out | ios_base::app);
        if (m_traceFile) {
            m_log.warn("tracing enabled to (%s)", tracefile.c_str());
        }
        else {
            m_log.error("tracing enabled but unable to open trace file (%s), errno=%d", tracefile.c_str(), errno);
        }
    }

    m_log.info("libcurl HTTPClient installed, connectTimeout (%u), timeout (%u)", m_connectTimeout, m_timeout);
}

CurlHTTPClient::~CurlHTTPClient()
{
    m_traceFile.close();
    if (m_curlInit) {
        curl_global_cleanup();
    }
}

#define SAMLSP_CURL_SET(opt, val) \
    if (curl_easy_setopt(m_handle, opt, val) != CURLE_OK) { \
        curl_easy_cleanup(m_handle); \
        throw TransportException("Failed to set "#opt) ; \
    }

CURL* CurlHTTPClient::newHandle() const
{
    CURL* m_handle = curl_easy_init();
    if (!m_handle) {
        return nullptr;
    }

    SAMLSP_CURL_SET(CURLOPT_NOPROGRESS, 1L);
    SAMLSP_CURL_SET(CURLOPT_NOSIGNAL, 1L);
    // Every status is handed back to the caller.
    SAMLSP_CURL_SET(CURLOPT_FAILONERROR, 0L);
    SAMLSP_CURL_SET(CURLOPT_PROTOCOLS_STR, "http,https");
    SAMLSP_CURL_SET(CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    SAMLSP_CURL_SET(CURLOPT_FOLLOWLOCATION, m_maxRedirects > 0 ? 1L : 0L);
    SAMLSP_CURL_SET(CURLOPT_MAXREDIRS, static_cast<long>(m_maxRedirects));
    SAMLSP_CURL_SET(CURLOPT_ACCEPT_ENCODING, "");
    SAMLSP_CURL_SET(CURLOPT_USERAGENT, m_userAgent.c_str());

    SAMLSP_CURL_SET(CURLOPT_SSL_VERIFYPEER, 1L);
    SAMLSP_CURL_SET(CURLOPT_SSL_VERIFYHOST, 2L);
    if (!m_ciphers.empty()) {
        SAMLSP_CURL_SET(CURLOPT_SSL_CIPHER_LIST, m_ciphers.c_str());
    }
    if (!m_caFile.empty()) {
        SAMLSP_CURL_SET(CURLOPT_CAINFO, m_caFile.c_str());
    }

    SAMLSP_CURL_SET(CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_connectTimeout));
    SAMLSP_CURL_SET(CURLOPT_TIMEOUT, static_cast<long>(m_timeout));

    SAMLSP_CURL_SET(CURLOPT_WRITEFUNCTION, &curl_write_hook);

    if (m_traceFile.is_open()) {
        SAMLSP_CURL_SET(CURLOPT_VERBOSE, 1L);
        SAMLSP_CURL_SET(CURLOPT_DEBUGFUNCTION, &curl_debug_hook);
        SAMLSP_CURL_SET(CURLOPT_DEBUGDATA, &m_traceFile);
    }
    return m_handle;
}

#undef SAMLSP_CURL_SET

// Inside an operation the handle is owned by the destructor.
#define SAMLSP_CURL_SET(opt, val) \
    if (curl_easy_setopt(m_handle, opt, val) != CURLE_OK) { \
        throw TransportException("Failed to set "#opt) ; \
    }

long CurlHTTPClient::send(const HTTPClientRequest& request, ostream& output) const
{
    CurlOperation op(*this);
    for (map<string,string>::const_iterator h = request.getHeaders().begin(); h != request.getHeaders().end(); ++h) {
        op.setRequestHeader(h->first.c_str(), h->second.c_str());
    }
    if (m_traceFile.is_open()) {
        lock_guard<mutex> locker(m_traceLock);
        return op.send(request.getURL(), output);
    }
    return op.send(request.getURL(), output);
}

long CurlOperation::send(const char* url, ostream& out)
{
    SAMLSP_CURL_SET(CURLOPT_URL, url);
    SAMLSP_CURL_SET(CURLOPT_HTTPGET, 1L);
    SAMLSP_CURL_SET(CURLOPT_WRITEDATA, &out);

    char curl_errorbuf[CURL_ERROR_SIZE];
    curl_errorbuf[0] = 0;
    SAMLSP_CURL_SET(CURLOPT_ERRORBUFFER, curl_errorbuf);

    if (m_headers) {
        SAMLSP_CURL_SET(CURLOPT_HTTPHEADER, m_headers);
    }

    m_client.logger().debug("sending GET request to %s", url);
    CURLcode code = curl_easy_perform(m_handle);

    if (code != CURLE_OK) {
        TransportException ex(string("Remote request failed at ") + url + ": " +
            (curl_errorbuf[0] ? curl_errorbuf : curl_easy_strerror(code)));
        ex.addProperty(SPException::URL_PROP_NAME, url);
        throw ex;
    }

    long status = 0;
    if (curl_easy_getinfo(m_handle, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
        throw TransportException(string("Unable to obtain response status from ") + url);
    }

    m_client.logger().debug("received status %ld from %s", status, url);
    return status;
}
