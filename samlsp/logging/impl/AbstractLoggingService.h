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
 * logging/impl/AbstractLoggingService.h
 *
 * Base class for LoggingService/SPI implementations.
 */

#ifndef __samlsp_abstractlogging_h__
#define __samlsp_abstractlogging_h__

#include "internal.h"
#include "logging/impl/LoggingServiceSPI.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <samlsp/logging/LoggingService.h>

#include <boost/property_tree/ptree.hpp>

namespace samlsp {

    /**
     * Base class for logging services that handles category management.
     *
     * <p>The property tree passed to the constructor is the root of the library
     * configuration and may contain these sections:</p>
     *
     * [logging]
     * default-level = INFO
     *
     * [logging-categories]
     * SAMLSP.MetadataFetcher = DEBUG
     *
     * <p>Levels are not inherited between dotted category names.</p>
     */
    class SAMLSP_API AbstractLoggingService : public virtual LoggingService, public virtual LoggingServiceSPI
    {
        MAKE_NONCOPYABLE(AbstractLoggingService);
    protected:
        AbstractLoggingService(const boost::property_tree::ptree& pt);

        /**
         * Produces the text of a log line, without a line terminator.
         *
         * @param category  logging category
         * @param prio      message priority
         * @param message   logging message
         * @return the formatted line
         */
        std::string formatMessage(const Category& category, Priority::Value prio, const std::string& message) const;

    public:
        virtual ~AbstractLoggingService();

        bool init();
        void term();
        Category& getCategory(const std::string& name);

        static const char CATEGORIES_SECTION_NAME[];
        static const char DEFAULT_LEVEL_PROP_PATH[];

    private:
        const boost::property_tree::ptree m_config;

        Priority::Value m_defaultPriority;
        std::map<std::string,Priority::Value> m_priorityMap;
        std::map<std::string,std::unique_ptr<Category>> m_categoryMap;

        // Guards category map.
        std::mutex m_lock;
    };

};

#endif /* __samlsp_abstractlogging_h__ */
