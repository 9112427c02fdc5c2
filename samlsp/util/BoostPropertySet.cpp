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
 * util/BoostPropertySet.cpp
 *
 * PropertySet over a Boost property tree.
 */

#include "internal.h"
#include "util/BoostPropertySet.h"

#include <type_traits>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

using namespace samlsp;
using namespace boost;
using namespace std;

namespace {
    template <typename T> T getNumeric(const property_tree::ptree* pt, const char* name, T defaultValue)
    {
        if (pt && name) {
            const boost::optional<const property_tree::ptree&> child = pt->get_child_optional(name);
            if (child) {
                const string val = trim_copy(child->data());
                // lexical_cast wraps negative input for unsigned targets.
                if (std::is_unsigned<T>::value && starts_with(val, "-")) {
                    return defaultValue;
                }
                try {
                    return lexical_cast<T>(val);
                }
                catch (const bad_lexical_cast&) {
                }
            }
        }
        return defaultValue;
    }
}

PropertySet::PropertySet()
{
}

PropertySet::~PropertySet()
{
}

BoostPropertySet::BoostPropertySet() : m_pt(nullptr)
{
}

BoostPropertySet::~BoostPropertySet()
{
}

void BoostPropertySet::load(const property_tree::ptree& pt)
{
    m_pt = &pt;
}

bool BoostPropertySet::hasProperty(const char* name) const
{
    return m_pt && name && m_pt->get_child_optional(name);
}

bool BoostPropertySet::getBool(const char* name, bool defaultValue) const
{
    if (m_pt && name) {
        const boost::optional<const property_tree::ptree&> child = m_pt->get_child_optional(name);
        if (child) {
            const string val = trim_copy(child->data());
            return val == "1" || val == "true";
        }
    }
    return defaultValue;
}

const char* BoostPropertySet::getString(const char* name, const char* defaultValue) const
{
    if (m_pt && name) {
        const boost::optional<const property_tree::ptree&> child = m_pt->get_child_optional(name);
        if (child) {
            return child->data().c_str();
        }
    }
    return defaultValue;
}

unsigned int BoostPropertySet::getUnsignedInt(const char* name, unsigned int defaultValue) const
{
    return getNumeric<unsigned int>(m_pt, name, defaultValue);
}

int BoostPropertySet::getInt(const char* name, int defaultValue) const
{
    return getNumeric<int>(m_pt, name, defaultValue);
}
