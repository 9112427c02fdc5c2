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
 * @file samlsp/base.h
 *
 * Base header file definitions
 * Must be included prior to including any other header
 */

#ifndef __samlsp_base_h__
#define __samlsp_base_h__

#include <samlsp/config_pub.h>

#include <saml/base.h>

// Windows and GCC4 Symbol Visibility Macros
#ifdef WIN32
  #define SAMLSP_IMPORT __declspec(dllimport)
  #define SAMLSP_EXPORT __declspec(dllexport)
  #define SAMLSP_DLLLOCAL
  #define SAMLSP_DLLPUBLIC
#else
  #define SAMLSP_IMPORT
  #ifdef GCC_HASCLASSVISIBILITY
    #define SAMLSP_EXPORT __attribute__ ((visibility("default")))
    #define SAMLSP_DLLLOCAL __attribute__ ((visibility("hidden")))
    #define SAMLSP_DLLPUBLIC __attribute__ ((visibility("default")))
  #else
    #define SAMLSP_EXPORT
    #define SAMLSP_DLLLOCAL
    #define SAMLSP_DLLPUBLIC
  #endif
#endif

// Define SAMLSP_API for DLL builds
#ifdef SAMLSP_EXPORTS
  #define SAMLSP_API SAMLSP_EXPORT
#else
  #define SAMLSP_API SAMLSP_IMPORT
#endif

// Throwable classes must always be visible on GCC in all binaries
#ifdef WIN32
  #define SAMLSP_EXCEPTIONAPI(api) api
#elif defined(GCC_HASCLASSVISIBILITY)
  #define SAMLSP_EXCEPTIONAPI(api) SAMLSP_EXPORT
#else
  #define SAMLSP_EXCEPTIONAPI(api)
#endif

/**
 * Blocks copy c'tor and assignment operator for a class.
 */
#define MAKE_NONCOPYABLE(type) \
    private: \
        type(const type&); \
        type& operator=(const type&)

/** Logging category for library functions. */
#define SAMLSP_LOGCAT "SAMLSP"

/** Default name of library configuration file. */
#define SAMLSP_CONFIG  "samlsp.ini"

#endif /* __samlsp_base_h__ */
