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
 * exceptions.cpp
 *
 * Exception classes.
 */

#include "internal.h"
#include "exceptions.h"
#include "io/HTTPClient.h"

#include <boost/lexical_cast.hpp>

using namespace samlsp;
using namespace std;

const char SPException::URL_PROP_NAME[] = "url";
const char SPException::ENTITY_ID_PROP_NAME[] = "entityID";

SPException::SPException(const char* msg) : m_status(HTTPClient::SAMLSP_HTTP_STATUS_ERROR)
{
    if (msg)
        m_msg = msg;
}

SPException::SPException(const string& msg) : m_status(HTTPClient::SAMLSP_HTTP_STATUS_ERROR), m_msg(msg)
{
}

SPException::~SPException() noexcept
{
}

const char* SPException::what() const noexcept
{
    return m_msg.c_str();
}

int SPException::getStatusCode() const noexcept
{
    return m_status;
}

void SPException::setStatusCode(int code) noexcept
{
    m_status = code;
}

const unordered_map<string,string>& SPException::getProperties() const noexcept
{
    return m_props;
}

const char* SPException::getProperty(const char* name) const noexcept
{
    if (!name) {
        return nullptr;
    }
    const auto& p = m_props.find(name);
    return p == m_props.end() ? nullptr : p->second.c_str();
}

void SPException::addProperty(const char* name, const char* value)
{
    if (name && value) {
        m_props[name] = value;
    }
}

HTTPStatusException::HTTPStatusException(long status)
    : TransportException(boost::lexical_cast<string>(status) + ' ' + HTTPClient::getReasonPhrase(status)),
        m_httpStatus(status)
{
    setStatusCode(HTTPClient::SAMLSP_HTTP_STATUS_BADGATEWAY);
}

UnexpectedRootException::UnexpectedRootException(
    const string& expectedNS, const string& expected, const string& actualNS, const string& actual
    ) : DecodeException("expected element type <" + expected + "> but have <" + actual + ">"),
        m_expectedNS(expectedNS), m_expected(expected), m_actualNS(actualNS), m_actual(actual)
{
}

bool UnexpectedRootException::isActually(const char* ns, const char* name) const noexcept
{
    return ns && name && m_actualNS == ns && m_actual == name;
}
