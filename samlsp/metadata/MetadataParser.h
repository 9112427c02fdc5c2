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
 * @file samlsp/metadata/MetadataParser.h
 *
 * Decodes SAML metadata documents.
 */

#ifndef __samlsp_mdparser_h__
#define __samlsp_mdparser_h__

#include <samlsp/base.h>

#include <memory>
#include <string>

namespace opensaml {
    namespace saml2md {
        class SAML_API EntitiesDescriptor;
        class SAML_API EntityDescriptor;
    };
};

namespace samlsp {

    class SAMLSP_API Category;

    /**
     * Static functions that decode metadata documents into OpenSAML objects.
     *
     * <p>The library must be initialized, since decoding relies on the XML
     * parser pool and object builders it registers.</p>
     *
     * <p>All failures raise a MetadataException subtype: DecodeException for
     * malformed content, UnexpectedRootException when the document element is of
     * the wrong type, NoIdPEntityException when a collection holds no IdP.</p>
     */
    class SAMLSP_API MetadataParser
    {
        MAKE_NONCOPYABLE(MetadataParser);
    public:
        /**
         * Decodes a document whose root is an EntityDescriptor.
         *
         * @param data  the document
         * @return  the entity
         */
        static std::shared_ptr<const opensaml::saml2md::EntityDescriptor> decodeEntityDescriptor(const std::string& data);

        /**
         * Decodes a document whose root is an EntitiesDescriptor.
         *
         * @param data  the document
         * @return  the collection
         */
        static std::unique_ptr<opensaml::saml2md::EntitiesDescriptor> decodeEntitiesDescriptor(const std::string& data);

        /**
         * Decodes an IdP's metadata from a document holding a single entity or a collection.
         *
         * <p>A single entity is returned as is. For a collection, the first member
         * with an IDPSSODescriptor, in document order, is returned.</p>
         *
         * @param data  the document
         * @param log   category for diagnostics
         * @return  the IdP entity
         */
        static std::shared_ptr<const opensaml::saml2md::EntityDescriptor> parseIdPMetadata(
            const std::string& data, Category& log
            );

        /**
         * Returns an entity's entityID in UTF-8.
         *
         * @param entity    the entity
         * @return  the entityID, empty if missing
         */
        static std::string getEntityID(const opensaml::saml2md::EntityDescriptor& entity);
    };

};

#endif /* __samlsp_mdparser_h__ */
