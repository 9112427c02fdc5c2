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
 * logging/impl/LoggingServiceSPI.h
 *
 * Output side of a logging service.
 */

#ifndef __samlsp_loggingspi_h__
#define __samlsp_loggingspi_h__

#include <samlsp/logging/Category.h>

namespace samlsp {

    /**
     * Output half of a logging service, called by Category objects once a
     * message has passed the priority check and been formatted.
     */
    class SAMLSP_API LoggingServiceSPI
    {
        MAKE_NONCOPYABLE(LoggingServiceSPI);
    protected:
        LoggingServiceSPI();
    public:
        virtual ~LoggingServiceSPI();

        /**
         * Outputs a logging message.
         *
         * @param category  logging category
         * @param prio      message priority
         * @param message   logging message
         */
        virtual void outputMessage(const Category& category, Priority::Value prio, const std::string& message)=0;
    };

};

#endif /* __samlsp_loggingspi_h__ */
