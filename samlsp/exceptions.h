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
 * @file samlsp/exceptions.h
 *
 * Exception classes.
 */

#ifndef __samlsp_exceptions_h__
#define __samlsp_exceptions_h__

#include <samlsp/base.h>

#include <exception>
#include <string>
#include <unordered_map>

/**
 * Declares a library exception subclass.
 *
 * @param name      the exception class
 * @param linkage   linkage specification for class
 * @param base      the base class
 */
#define DECL_SAMLSP_EXCEPTION(name,linkage,base) \
    class linkage name : public base { \
    public: \
        name(const char* msg=nullptr) : base(msg) {} \
        name(const std::string& msg) : base(msg) {} \
        virtual ~name() noexcept {} \
    }

namespace samlsp {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4250 4251 )
#endif

    /**
     * Base exception class, supports attaching additional data for error handling.
     */
    class SAMLSP_EXCEPTIONAPI(SAMLSP_API) SPException : public std::exception
    {
    public:
        virtual ~SPException() noexcept;

        /**
         * Constructs an exception using a message.
         *
         * @param msg   error message
         */
        SPException(const char* msg=nullptr);

        /**
         * Constructs an exception using a message.
         *
         * @param msg   error message
         */
        SPException(const std::string& msg);

        /**
         * Returns the error message.
         *
         * @return  the message
         */
        const char* what() const noexcept;

        /**
         * Gets the HTTP status code for the error condition.
         *
         * @return status code
         */
        int getStatusCode() const noexcept;

        /**
         * Sets the HTTP status code for the error condition if not the default of 500.
         *
         * @param code status code
         */
        void setStatusCode(int code) noexcept;

        /**
         * Gets the properties attached to this exception.
         *
         * @return property map
         */
        const std::unordered_map<std::string,std::string>& getProperties() const noexcept;

        /**
         * Gets a specific property attached to this exception.
         *
         * @param name property name
         *
         * @return property value or null
         */
        const char* getProperty(const char* name) const noexcept;

        /**
         * Attach a single named property.
         *
         * @param name  the property name
         * @param value the property value
         */
        void addProperty(const char* name, const char* value);

        // Defined properties.
        static const char URL_PROP_NAME[];
        static const char ENTITY_ID_PROP_NAME[];

    private:
        int m_status;
        std::string m_msg;
        std::unordered_map<std::string,std::string> m_props;
    };

    DECL_SAMLSP_EXCEPTION(ConfigurationException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::SPException);
    DECL_SAMLSP_EXCEPTION(IOException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::SPException);
    DECL_SAMLSP_EXCEPTION(OperationException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::SPException);
    DECL_SAMLSP_EXCEPTION(TransportException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::SPException);
    DECL_SAMLSP_EXCEPTION(MetadataException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::SPException);
    DECL_SAMLSP_EXCEPTION(DecodeException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::MetadataException);
    DECL_SAMLSP_EXCEPTION(NoIdPEntityException,SAMLSP_EXCEPTIONAPI(SAMLSP_API),samlsp::MetadataException);

    /**
     * Transport-level failure produced by a response with an unacceptable HTTP status.
     */
    class SAMLSP_EXCEPTIONAPI(SAMLSP_API) HTTPStatusException : public TransportException {
    public:
        /**
         * Constructor.
         *
         * <p>The message is formed from the status code and its reason phrase.</p>
         *
         * @param status    HTTP status code returned
         */
        HTTPStatusException(long status);
        virtual ~HTTPStatusException() noexcept {}

        /**
         * Returns the HTTP status code that was returned.
         *
         * @return status code
         */
        long getHTTPStatus() const noexcept {
            return m_httpStatus;
        }

    private:
        long m_httpStatus;
    };

    /**
     * Decoding failure caused by a document whose root element is not the type expected.
     *
     * <p>Element names are carried as namespace URI and local name pairs so callers can
     * branch on the actual root type without inspecting the message.</p>
     */
    class SAMLSP_EXCEPTIONAPI(SAMLSP_API) UnexpectedRootException : public DecodeException {
    public:
        /**
         * Constructor.
         *
         * @param expectedNS    namespace of the expected element
         * @param expected      local name of the expected element
         * @param actualNS      namespace of the actual root element
         * @param actual        local name of the actual root element
         */
        UnexpectedRootException(
            const std::string& expectedNS,
            const std::string& expected,
            const std::string& actualNS,
            const std::string& actual
            );
        virtual ~UnexpectedRootException() noexcept {}

        const std::string& getExpectedNamespace() const noexcept {
            return m_expectedNS;
        }

        const std::string& getExpectedName() const noexcept {
            return m_expected;
        }

        const std::string& getActualNamespace() const noexcept {
            return m_actualNS;
        }

        const std::string& getActualName() const noexcept {
            return m_actual;
        }

        /**
         * Returns true iff the actual root element matches the supplied name.
         *
         * @param ns        namespace to compare
         * @param name      local name to compare
         * @return true iff the actual root element has the given name
         */
        bool isActually(const char* ns, const char* name) const noexcept;

    private:
        std::string m_expectedNS, m_expected, m_actualNS, m_actual;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_exceptions_h__ */
