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
 * util/SPConstants.cpp
 *
 * SAML SP XML constants.
 */

#include "internal.h"
#include "util/SPConstants.h"

using namespace samlspconstants;

const char samlspconstants::SAML20MD_NS[] = "urn:oasis:names:tc:SAML:2.0:metadata";
