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
 * @file samlsp/util/PluginManager.h
 *
 * Plugin management template.
 */

#ifndef __samlsp_plugin_h__
#define __samlsp_plugin_h__

#include <samlsp/base.h>

#include <map>
#include <string>
#include <stdexcept>

namespace samlsp {

    /**
     * Registry of factories building plugins of one interface type, keyed by type name.
     *
     * @param T         class of plugin to manage
     * @param Key       the key for type lookup
     * @param Params    parameters for plugin construction
     */
    template <class T, class Key, typename Params> class PluginManager
    {
        MAKE_NONCOPYABLE(PluginManager);
    public:
        /**
         * Constructor.
         *
         * @param componentType name of the plugin interface, used in error messages
         */
        PluginManager(const char* componentType) : m_componentType(componentType) {}
        ~PluginManager() {}

        /** Factory function for plugin. */
        typedef T* Factory(const Params&, bool deprecationSupport);

        /**
         * Registers the factory for a given type, replacing any earlier one.
         *
         * @param type      the key to the plugin type
         * @param factory   the factory function for the plugin type
         */
        void registerFactory(const Key& type, Factory* factory) {
            if (factory)
                m_map[type] = factory;
        }

        /**
         * Unregisters all registered factories.
         */
        void deregisterFactories() {
            m_map.clear();
        }

        /**
         * Returns true iff a factory is registered for a type.
         *
         * @param type  the key to the plugin type
         * @return true iff the type is known
         */
        bool hasFactory(const Key& type) const {
            return m_map.find(type) != m_map.end();
        }

        /**
         * Builds a new instance of a plugin of a given type.
         *
         * @param type  the key to the plugin type
         * @param p     parameters to configure plugin
         * @param deprecationSupport true iff the plugin should recognize its deprecated settings
         *
         * @return      the constructed plugin, owned by the caller
         */
        T* newPlugin(const Key& type, const Params& p, bool deprecationSupport) const {
            typename std::map<Key,Factory*>::const_iterator i = m_map.find(type);
            if (i == m_map.end())
                throw std::invalid_argument("Unknown " + m_componentType + " plugin type.");
            return i->second(p, deprecationSupport);
        }

    private:
        std::string m_componentType;
        std::map<Key,Factory*> m_map;
    };

};

#endif /* __samlsp_plugin_h__ */
