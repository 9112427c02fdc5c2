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
 * @file samlsp/util/SPConstants.h
 *
 * SAML SP XML constants.
 */

#ifndef __samlsp_constants_h__
#define __samlsp_constants_h__

#include <samlsp/base.h>

/**
 * SAML SP XML constants.
 */
namespace samlspconstants {

    /** SAML 2.0 metadata namespace ("urn:oasis:names:tc:SAML:2.0:metadata") */
    extern SAMLSP_API const char SAML20MD_NS[];

};

#endif /* __samlsp_constants_h__ */
