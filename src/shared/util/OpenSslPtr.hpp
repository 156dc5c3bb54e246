/**
 * @file OpenSslPtr.hpp
 * @brief RAII owners for OpenSSL objects passed across ports
 */

#pragma once

#include <memory>
#include <openssl/x509.h>
#include <openssl/evp.h>
#include <openssl/cms.h>
#include <openssl/bio.h>

namespace epassport::shared::util {

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

struct X509CrlDeleter { void operator()(X509_CRL* p) const { X509_CRL_free(p); } };
using X509CrlPtr = std::unique_ptr<X509_CRL, X509CrlDeleter>;

struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

struct CmsDeleter { void operator()(CMS_ContentInfo* p) const { CMS_ContentInfo_free(p); } };
using CmsPtr = std::unique_ptr<CMS_ContentInfo, CmsDeleter>;

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/**
 * @brief Take an additional reference on a shared certificate
 */
inline X509Ptr shareCertificate(X509* cert) {
    if (!cert || X509_up_ref(cert) != 1) {
        return X509Ptr();
    }
    return X509Ptr(cert);
}

/**
 * @brief Take an additional reference on a shared CRL
 */
inline X509CrlPtr shareCrl(X509_CRL* crl) {
    if (!crl || X509_CRL_up_ref(crl) != 1) {
        return X509CrlPtr();
    }
    return X509CrlPtr(crl);
}

} // namespace epassport::shared::util
