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
 * security/impl/Credential.cpp
 *
 * SP key material.
 */

#include "internal.h"
#include "exceptions.h"
#include "logging/Category.h"
#include "security/Credential.h"
#include "util/Misc.h"

#include <cstring>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

using namespace samlsp;
using namespace std;

namespace {

    int passwd_callback(char* buf, int len, int verify, void* passwd)
    {
        if (!verify) {
            if (passwd && len > static_cast<int>(strlen(reinterpret_cast<char*>(passwd)))) {
                strcpy(buf, reinterpret_cast<char*>(passwd));
                return strlen(buf);
            }
        }
        return 0;
    }

    // Drains the OpenSSL error queue into a message.
    string openssl_errors()
    {
        string msg;
        char buf[256];
        unsigned long code;
        while ((code = ERR_get_error()) != 0) {
            ERR_error_string_n(code, buf, sizeof(buf));
            if (!msg.empty()) {
                msg += "; ";
            }
            msg += buf;
        }
        return msg.empty() ? "no further information available" : msg;
    }

    struct BIODeleter {
        void operator()(BIO* b) const {
            BIO_free(b);
        }
    };

    unique_ptr<BIO,BIODeleter> memory_bio(const string& data)
    {
        unique_ptr<BIO,BIODeleter> in(BIO_new_mem_buf(data.data(), static_cast<int>(data.length())));
        if (!in) {
            throw ConfigurationException("Unable to allocate OpenSSL memory BIO.");
        }
        return in;
    }

    string x509_name(X509_NAME* name)
    {
        string ret;
        unique_ptr<BIO,BIODeleter> out(BIO_new(BIO_s_mem()));
        if (name && out && X509_NAME_print_ex(out.get(), name, 0, XN_FLAG_RFC2253) >= 0) {
            char* data = nullptr;
            long len = BIO_get_mem_data(out.get(), &data);
            if (data && len > 0) {
                ret.assign(data, len);
            }
        }
        return ret;
    }
};

PrivateKey::PrivateKey(EVP_PKEY* key) : m_key(key)
{
    if (!m_key) {
        throw ConfigurationException("No private key supplied.");
    }
}

PrivateKey::~PrivateKey()
{
    EVP_PKEY_free(m_key);
}

shared_ptr<const PrivateKey> PrivateKey::fromPEM(const string& pem, const char* password)
{
    ERR_clear_error();
    unique_ptr<BIO,BIODeleter> in(memory_bio(pem));
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(in.get(), nullptr, passwd_callback, const_cast<char*>(password));
    if (!pkey) {
        string msg(openssl_errors());
        Category::getInstance(SAMLSP_LOGCAT ".Credential").error("unable to decode private key: %s", msg.c_str());
        throw ConfigurationException("Unable to decode PEM private key: " + msg);
    }
    return shared_ptr<const PrivateKey>(new PrivateKey(pkey));
}

shared_ptr<const PrivateKey> PrivateKey::fromFile(const char* path, const char* password)
{
    Category::getInstance(SAMLSP_LOGCAT ".Credential").debug("loading private key from (%s)", path ? path : "");
    return fromPEM(FileSupport::read(path), password);
}

EVP_PKEY* PrivateKey::getEVPKey() const
{
    return m_key;
}

string PrivateKey::getAlgorithm() const
{
    int type = EVP_PKEY_base_id(m_key);
    switch (type) {
        case EVP_PKEY_RSA:  return "RSA";
        case EVP_PKEY_DSA:  return "DSA";
        case EVP_PKEY_EC:   return "EC";
    }
    const char* sn = OBJ_nid2sn(type);
    return sn ? sn : "";
}

int PrivateKey::getBits() const
{
    return EVP_PKEY_bits(m_key);
}

Certificate::Certificate(X509* cert) : m_cert(cert)
{
    if (!m_cert) {
        throw ConfigurationException("No certificate supplied.");
    }
}

Certificate::~Certificate()
{
    X509_free(m_cert);
}

shared_ptr<const Certificate> Certificate::fromData(const string& data)
{
    ERR_clear_error();
    unique_ptr<BIO,BIODeleter> in(memory_bio(data));
    X509* x = PEM_read_bio_X509(in.get(), nullptr, nullptr, nullptr);
    if (!x) {
        ERR_clear_error();
        in = memory_bio(data);
        x = d2i_X509_bio(in.get(), nullptr);
    }
    if (!x) {
        string msg(openssl_errors());
        Category::getInstance(SAMLSP_LOGCAT ".Credential").error("unable to decode certificate: %s", msg.c_str());
        throw ConfigurationException("Unable to decode certificate: " + msg);
    }
    return shared_ptr<const Certificate>(new Certificate(x));
}

shared_ptr<const Certificate> Certificate::fromFile(const char* path)
{
    Category::getInstance(SAMLSP_LOGCAT ".Credential").debug("loading certificate from (%s)", path ? path : "");
    return fromData(FileSupport::read(path));
}

X509* Certificate::getX509() const
{
    return m_cert;
}

string Certificate::getSubject() const
{
    return x509_name(X509_get_subject_name(m_cert));
}

string Certificate::getIssuer() const
{
    return x509_name(X509_get_issuer_name(m_cert));
}

bool Certificate::matches(const PrivateKey& key) const
{
    bool ret = X509_check_private_key(m_cert, key.getEVPKey()) == 1;
    ERR_clear_error();
    return ret;
}
