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
 * @file samlsp/LibraryConfig.h
 *
 * Library "global" configuration.
 */

#ifndef __samlsp_libraryconfig_h__
#define __samlsp_libraryconfig_h__

#include <samlsp/util/PluginManager.h>

#include <string>
#include <boost/property_tree/ptree.hpp>

namespace samlsp {

    class SAMLSP_API Category;
    class SAMLSP_API HTTPClient;
    class SAMLSP_API LoggingService;
    class SAMLSP_API PathResolver;

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4250 4251 )
#endif

    /**
     * Singleton interface that manages library startup/shutdown.
     */
    class SAMLSP_API LibraryConfig
    {
        MAKE_NONCOPYABLE(LibraryConfig);
    public:
        LibraryConfig();
        virtual ~LibraryConfig();

        /**
         * Returns the global configuration object for the library.
         *
         * @return reference to the global library configuration object
         */
        static LibraryConfig& getConfig();

        /**
         * Initializes the library.
         *
         * <p>Each process using the library MUST call this function before using any
         * library classes. Calls are reference counted and only the first loads the
         * configuration file; every call must be matched by a call to term().</p>
         *
         * <p>Without an explicit file, the SAMLSP_CONFIG environment variable is used,
         * and failing that "samlsp.ini" in the configuration directory.</p>
         *
         * @param config_file   path to the INI configuration file
         * @param rethrow       true iff failures should be raised rather than logged
         * @return true iff initialization was successful
         */
        virtual bool init(const char* config_file=nullptr, bool rethrow=false)=0;

        /**
         * Shuts down the library.
         *
         * <p>Throws std::runtime_error if the library is not initialized.</p>
         */
        virtual void term()=0;

        /**
         * Manages factories for LoggingService plugins.
         */
        PluginManager<LoggingService,std::string,boost::property_tree::ptree> LoggingServiceManager;

        /**
         * Manages factories for HTTPClient plugins.
         */
        PluginManager<HTTPClient,std::string,boost::property_tree::ptree> HTTPClientManager;

        /**
         * Returns a PathResolver instance.
         *
         * @return path resolver
         */
        virtual const PathResolver& getPathResolver() const=0;

        /**
         * Returns the configured logging service.
         *
         * <p>This method will throw in the event the library is not yet initialized.</p>
         *
         * @return logging service
         */
        virtual LoggingService& getLoggingService() const=0;

        /**
         * Returns the default HTTP client, built from the [http] section of the
         * configuration the first time it is needed.
         *
         * <p>This method will throw in the event the library is not yet initialized.</p>
         *
         * @return the default HTTP client
         */
        virtual const HTTPClient& getHTTPClient() const=0;

        /**
         * Returns the root of the configuration tree loaded at initialization.
         *
         * <p>This method will throw in the event the library is not yet initialized.</p>
         *
         * @return configuration tree
         */
        virtual const boost::property_tree::ptree& getConfiguration() const=0;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_libraryconfig_h__ */
