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
#include <string>
#include <openssl/ssl.h>
#include "ph/identity.hpp"

namespace ph::internal {

// Lightweight RAII wrapper over a server SSL_CTX (TLS 1.2+, no client certs).
// Throws ph::TlsError if the identity cannot be installed.
class TlsContext {
public:
    explicit TlsContext(const ph::TlsIdentity& id);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;

    [[noreturn]] void fail(const char* where);
};

// Drains the OpenSSL error queue into the log, one line per entry.
// Returns the text of the first entry (empty if the queue was empty).
std::string drain_openssl_errors(const char* where);

} // namespace ph::internal
