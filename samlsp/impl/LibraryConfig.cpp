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
 * impl/LibraryConfig.cpp
 *
 * Library configuration.
 */

#include "internal.h"

#include "exceptions.h"
#include "LibraryConfig.h"
#include "io/HTTPClient.h"
#include "logging/LoggingService.h"
#include "util/PathResolver.h"

#include <climits>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <boost/property_tree/ini_parser.hpp>
#include <saml/SAMLConfig.h>
#include <xmltooling/XMLToolingConfig.h>

using namespace samlsp;
using namespace boost::property_tree;
using namespace std;

namespace samlsp {
    class SAMLSP_DLLLOCAL LibraryInternalConfig : public LibraryConfig
    {
    public:
        LibraryInternalConfig() : m_initCount(0) {}
        ~LibraryInternalConfig() {}

        bool init(const char* config_file=nullptr, bool rethrow=false);
        void term();

        const PathResolver& getPathResolver() const {
            return m_pathResolver;
        }
        LoggingService& getLoggingService() const;
        const HTTPClient& getHTTPClient() const;
        const ptree& getConfiguration() const;

        static const char HTTP_SECTION_NAME[];
        static const char HTTP_TYPE_PROP_NAME[];
        static const char XMLTOOLING_LOGGING_PROP_PATH[];

    private:
        bool _init(const char* config_file, bool rethrow);
        void _term();

        unsigned int m_initCount;
        mutex m_lock;
        PathResolver m_pathResolver;
        unique_ptr<ptree> m_config;
        unique_ptr<LoggingService> m_logging;

        mutable mutex m_clientLock;
        mutable unique_ptr<HTTPClient> m_httpClient;
    };

    LibraryInternalConfig g_config;
}

const char LibraryInternalConfig::HTTP_SECTION_NAME[] = "http";
const char LibraryInternalConfig::HTTP_TYPE_PROP_NAME[] = "type";
const char LibraryInternalConfig::XMLTOOLING_LOGGING_PROP_PATH[] = "logging.xmltooling";

LibraryConfig& LibraryConfig::getConfig()
{
    return g_config;
}

LibraryConfig::LibraryConfig()
    : LoggingServiceManager("LoggingService"), HTTPClientManager("HTTPClient")
{
}

LibraryConfig::~LibraryConfig()
{
}

LoggingService& LibraryInternalConfig::getLoggingService() const
{
    if (m_logging) {
        return *m_logging;
    }
    throw logic_error("LoggingService not initialized.");
}

const ptree& LibraryInternalConfig::getConfiguration() const
{
    if (m_config) {
        return *m_config;
    }
    throw logic_error("Library not initialized.");
}

const HTTPClient& LibraryInternalConfig::getHTTPClient() const
{
    lock_guard<mutex> locker(m_clientLock);

    if (!m_httpClient) {
        const ptree& config = getConfiguration();
        const ptree& section = config.get_child(HTTP_SECTION_NAME, ptree());
        string type = section.get(HTTP_TYPE_PROP_NAME, CURL_HTTP_CLIENT);
        m_httpClient.reset(HTTPClientManager.newPlugin(type, section, false));
    }

    return *m_httpClient;
}

bool LibraryInternalConfig::init(const char* config_file, bool rethrow)
{
    lock_guard<mutex> locker(m_lock);

    if (m_initCount == INT_MAX) {
        if (rethrow) {
            throw runtime_error("Library initialized too many times.");
        }
        return false;
    }

    if (m_initCount > 0) {
        ++m_initCount;
        return true;
    }

    if (!_init(config_file, rethrow)) {
        return false;
    }

    ++m_initCount;
    return true;
}

bool LibraryInternalConfig::_init(const char* config_file, bool rethrow)
{
    const char* inst_prefix = getenv("SAMLSP_PREFIX");
    if (!inst_prefix || !*inst_prefix)
        inst_prefix = SAMLSP_PREFIX;
    string inst_prefix2;
    while (*inst_prefix) {
        inst_prefix2.push_back((*inst_prefix=='\\') ? ('/') : (*inst_prefix));
        ++inst_prefix;
    }
    m_pathResolver.setDefaultPrefix(inst_prefix2.c_str());

    const char* dir = getenv("SAMLSP_CFGDIR");
    if (!dir || !*dir)
        dir = SAMLSP_CFGDIR;
    m_pathResolver.setCfgDir(dir);
    dir = getenv("SAMLSP_LOGDIR");
    if (!dir || !*dir)
        dir = SAMLSP_LOGDIR;
    m_pathResolver.setLogDir(dir);

    if (!config_file || !*config_file)
        config_file = getenv("SAMLSP_CONFIG");
    string path(config_file && *config_file ? config_file : SAMLSP_CONFIG);
    m_pathResolver.resolve(path, PathResolver::SAMLSP_CFG_FILE);

    try {
        unique_ptr<ptree> config(new ptree());
        ini_parser::read_ini(path, *config);

        registerLoggingServices();
        registerHTTPClients();

        string loggingType = config->get(LoggingService::LOGGING_TYPE_PROP_PATH, CONSOLE_LOGGING_SERVICE);
        unique_ptr<LoggingService> logging(LoggingServiceManager.newPlugin(loggingType, *config, false));
        if (!logging->init()) {
            throw runtime_error("Unable to initialize LoggingService.");
        }

        m_config.swap(config);
        m_logging.swap(logging);

        // The decoding layer needs the XML parser pool and object builders.
        Category& log = Category::getInstance(SAMLSP_LOGCAT ".Config");
        if (!xmltooling::XMLToolingConfig::getConfig().log_config(
                m_config->get(XMLTOOLING_LOGGING_PROP_PATH, string("WARN")).c_str())) {
            log.warn("unable to configure XMLTooling logging");
        }
        if (!opensaml::SAMLConfig::getConfig().init()) {
            log.crit("failed to initialize OpenSAML library");
            throw runtime_error("Unable to initialize OpenSAML library.");
        }
    }
    catch (const exception& ex) {
        if (m_logging) {
            m_logging->term();
            m_logging.reset();
        }
        m_config.reset();
        LoggingServiceManager.deregisterFactories();
        HTTPClientManager.deregisterFactories();
        if (rethrow) {
            throw;
        }
        cerr << "caught exception while initializing library: " << ex.what() << endl;
        return false;
    }

    Category::getInstance(SAMLSP_LOGCAT ".Config").info("%s library initialization complete, configured from (%s)",
        PACKAGE_STRING, path.c_str());
    return true;
}

void LibraryInternalConfig::term()
{
    lock_guard<mutex> locker(m_lock);

    if (m_initCount == 0) {
        throw runtime_error("Library terminated without initialization.");
    }
    else if (--m_initCount > 0) {
        return;
    }

    _term();
}

void LibraryInternalConfig::_term()
{
    Category::getInstance(SAMLSP_LOGCAT ".Config").info("%s library shutting down", PACKAGE_STRING);

    {
        lock_guard<mutex> locker(m_clientLock);
        m_httpClient.reset();
    }

    opensaml::SAMLConfig::getConfig().term();

    m_logging->term();
    m_logging.reset();
    m_config.reset();

    HTTPClientManager.deregisterFactories();
    LoggingServiceManager.deregisterFactories();
}
