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
 * @file samlsp/util/BoostPropertySet.h
 *
 * PropertySet over a Boost property tree.
 */

#ifndef __samlsp_boostpropset_h__
#define __samlsp_boostpropset_h__

#include <samlsp/util/PropertySet.h>

#include <boost/property_tree/ptree.hpp>

namespace samlsp {

    /**
     * Boost property tree-based property set implementation.
     *
     * <p>Suitable for trees read from INI files or built by hand. Names are
     * property tree paths, so "sp.baseURL" addresses a key in the [sp] section
     * of the root tree.</p>
     *
     * <p>Boolean values are "1" or "true", anything else is false.</p>
     */
    class SAMLSP_API BoostPropertySet : public virtual PropertySet
    {
    public:
        BoostPropertySet();
        virtual ~BoostPropertySet();

        bool hasProperty(const char* name) const;
        bool getBool(const char* name, bool defaultValue) const;
        const char* getString(const char* name, const char* defaultValue=nullptr) const;
        unsigned int getUnsignedInt(const char* name, unsigned int defaultValue) const;
        int getInt(const char* name, int defaultValue) const;

        /**
         * Loads the property set from a ptree owned and managed by the caller.
         *
         * @param pt        property tree instance to wrap
         */
        void load(const boost::property_tree::ptree& pt);

    private:
        const boost::property_tree::ptree* m_pt;
    };

};

#endif /* __samlsp_boostpropset_h__ */
