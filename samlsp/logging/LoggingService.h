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
 * @file samlsp/logging/LoggingService.h
 *
 * Logging service abstracting configuration and output of log messages.
 */

#ifndef __samlsp_logging_h__
#define __samlsp_logging_h__

#include <samlsp/logging/Category.h>

namespace samlsp {

    /**
     * Interface to a logging service.
     *
     * <p>Callers obtain Category objects by name and log through them; the
     * service decides where output goes and at which level each Category is set.</p>
     */
    class SAMLSP_API LoggingService
    {
        MAKE_NONCOPYABLE(LoggingService);
    protected:
        LoggingService();
    public:
        virtual ~LoggingService();

        /** Property path selecting the type of service to build. */
        static const char LOGGING_TYPE_PROP_PATH[];

        /**
         * Initializes the service.
         *
         * @return true iff the service is usable
         */
        virtual bool init()=0;

        /**
         * Shuts the service down.
         */
        virtual void term()=0;

        /**
         * Returns the Category of the given name, creating it on first use.
         *
         * <p>The object is owned by the service.</p>
         *
         * @param name category name
         * @return the Category
         */
        virtual Category& getCategory(const std::string& name)=0;
    };

    /**
     * Registers LoggingService classes into the runtime.
     */
    void SAMLSP_API registerLoggingServices();

    /** Logging to the console. */
    #define CONSOLE_LOGGING_SERVICE "console"

    /** Logging to a file. */
    #define FILE_LOGGING_SERVICE    "file"
};

#endif /* __samlsp_logging_h__ */
