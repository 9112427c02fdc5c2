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
 * @file samlsp/security/Credential.h
 *
 * SP key material.
 */

#ifndef __samlsp_credential_h__
#define __samlsp_credential_h__

#include <samlsp/base.h>

#include <memory>
#include <string>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace samlsp {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * A private key held in an OpenSSL EVP_PKEY.
     *
     * <p>The key is only held; no cryptographic operation is performed with it here.</p>
     */
    class SAMLSP_API PrivateKey
    {
        MAKE_NONCOPYABLE(PrivateKey);
    public:
        /**
         * Takes ownership of an OpenSSL key.
         *
         * @param key   key to own
         */
        PrivateKey(EVP_PKEY* key);
        ~PrivateKey();

        /**
         * Decodes a PEM-encoded private key.
         *
         * <p>Raises ConfigurationException if the data holds no usable key.</p>
         *
         * @param pem       PEM data
         * @param password  optional password for an encrypted key
         * @return  the decoded key
         */
        static std::shared_ptr<const PrivateKey> fromPEM(const std::string& pem, const char* password=nullptr);

        /**
         * Reads a PEM-encoded private key from a file.
         *
         * <p>Raises IOException if the file cannot be read.</p>
         *
         * @param path      path to key file
         * @param password  optional password for an encrypted key
         * @return  the decoded key
         */
        static std::shared_ptr<const PrivateKey> fromFile(const char* path, const char* password=nullptr);

        /**
         * Returns the underlying OpenSSL key, still owned by this object.
         *
         * @return the key
         */
        EVP_PKEY* getEVPKey() const;

        /**
         * Returns the algorithm of the key ("RSA", "EC", ...).
         *
         * @return algorithm name
         */
        std::string getAlgorithm() const;

        /**
         * Returns the size of the key in bits.
         *
         * @return key size
         */
        int getBits() const;

    private:
        EVP_PKEY* m_key;
    };

    /**
     * An X.509 certificate held in an OpenSSL X509.
     */
    class SAMLSP_API Certificate
    {
        MAKE_NONCOPYABLE(Certificate);
    public:
        /**
         * Takes ownership of an OpenSSL certificate.
         *
         * @param cert  certificate to own
         */
        Certificate(X509* cert);
        ~Certificate();

        /**
         * Decodes the first certificate in PEM data, falling back to DER.
         *
         * <p>Raises ConfigurationException if the data holds no certificate.</p>
         *
         * @param data  PEM or DER data
         * @return  the decoded certificate
         */
        static std::shared_ptr<const Certificate> fromData(const std::string& data);

        /**
         * Reads a PEM or DER certificate from a file.
         *
         * <p>Raises IOException if the file cannot be read.</p>
         *
         * @param path  path to certificate file
         * @return  the decoded certificate
         */
        static std::shared_ptr<const Certificate> fromFile(const char* path);

        /**
         * Returns the underlying OpenSSL certificate, still owned by this object.
         *
         * @return the certificate
         */
        X509* getX509() const;

        /**
         * Returns the subject name in OpenSSL's one-line RFC 2253 form.
         *
         * @return subject name
         */
        std::string getSubject() const;

        /**
         * Returns the issuer name in OpenSSL's one-line RFC 2253 form.
         *
         * @return issuer name
         */
        std::string getIssuer() const;

        /**
         * Returns true iff the certificate's public key corresponds to a private key.
         *
         * @param key   private key to check
         * @return  true iff the keys form a pair
         */
        bool matches(const PrivateKey& key) const;

    private:
        X509* m_cert;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_credential_h__ */
