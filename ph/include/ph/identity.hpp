/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#pragma once
#include <memory>
#include <string>
#include <openssl/ssl.h>
#include "ph/errors.hpp"

namespace ph {

// Certificate chain + private key decoded from a PKCS#12 bundle.
// Owns the OpenSSL objects; immutable once loaded.
class TlsIdentity {
public:
    TlsIdentity(EVP_PKEY* key, X509* cert, STACK_OF(X509)* chain);
    ~TlsIdentity();

    EVP_PKEY*       key()   const { return _key; }
    X509*           cert()  const { return _cert; }
    STACK_OF(X509)* chain() const { return _chain; }  // may be null

    // Subject CN of the leaf certificate, empty if absent.
    std::string common_name() const;

    // non-copyable
    TlsIdentity(const TlsIdentity&) = delete;
    TlsIdentity& operator=(const TlsIdentity&) = delete;

private:
    EVP_PKEY*       _key   = nullptr;
    X509*           _cert  = nullptr;
    STACK_OF(X509)* _chain = nullptr;
};

// Reads and decodes the bundle at `path`.
// Throws IdentityError(NotFound) when the file cannot be read and
// IdentityError(DecodeError) on a wrong passphrase or malformed bundle.
std::unique_ptr<TlsIdentity> load_identity(const std::string& path,
                                           const std::string& passphrase);

} // namespace ph
