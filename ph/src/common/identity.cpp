/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/identity.hpp"
#include "ph/internal/tls_ctx.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

#include <fstream>
#include <iterator>
#include <vector>

namespace ph {

TlsIdentity::TlsIdentity(EVP_PKEY* key, X509* cert, STACK_OF(X509)* chain)
    : _key(key), _cert(cert), _chain(chain)
{}

TlsIdentity::~TlsIdentity() {
    if (_chain) sk_X509_pop_free(_chain, X509_free);
    if (_cert)  X509_free(_cert);
    if (_key)   EVP_PKEY_free(_key);
}

std::string TlsIdentity::common_name() const {
    X509_NAME* subj = X509_get_subject_name(_cert);
    if (!subj) return {};
    char buf[256] = {0};
    int n = X509_NAME_get_text_by_NID(subj, NID_commonName, buf, sizeof(buf));
    if (n <= 0) return {};
    return std::string(buf, static_cast<std::size_t>(n));
}

static bool read_file_bytes(const std::string& path, std::vector<unsigned char>& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

std::unique_ptr<TlsIdentity> load_identity(const std::string& path,
                                           const std::string& passphrase)
{
    std::vector<unsigned char> der;
    if (!read_file_bytes(path, der)) {
        throw IdentityError(IdentityError::Kind::NotFound,
                            "identity bundle not found: " + path);
    }
    if (der.empty()) {
        throw IdentityError(IdentityError::Kind::DecodeError,
                            "identity bundle is empty: " + path);
    }

    BIO* bio = BIO_new_mem_buf(der.data(), static_cast<int>(der.size()));
    if (!bio) {
        std::string why = internal::drain_openssl_errors("BIO_new_mem_buf");
        throw IdentityError(IdentityError::Kind::DecodeError, "BIO_new_mem_buf failed: " + why);
    }
    PKCS12* p12 = d2i_PKCS12_bio(bio, nullptr);
    BIO_free(bio);
    if (!p12) {
        std::string why = internal::drain_openssl_errors("d2i_PKCS12_bio");
        throw IdentityError(IdentityError::Kind::DecodeError,
                            "malformed PKCS#12 bundle " + path + (why.empty() ? "" : ": " + why));
    }

    EVP_PKEY*       key   = nullptr;
    X509*           cert  = nullptr;
    STACK_OF(X509)* chain = nullptr;
    int ok = PKCS12_parse(p12, passphrase.c_str(), &key, &cert, &chain);
    PKCS12_free(p12);
    if (ok != 1) {
        std::string why = internal::drain_openssl_errors("PKCS12_parse");
        throw IdentityError(IdentityError::Kind::DecodeError,
                            "cannot decode PKCS#12 bundle " + path +
                            " (wrong passphrase?)" + (why.empty() ? "" : ": " + why));
    }

    // Take ownership first so every exit below frees what PKCS12_parse gave us.
    auto id = std::make_unique<TlsIdentity>(key, cert, chain);
    if (!key || !cert) {
        throw IdentityError(IdentityError::Kind::DecodeError,
                            "PKCS#12 bundle " + path + " lacks a certificate or private key");
    }
    return id;
}

} // namespace ph
