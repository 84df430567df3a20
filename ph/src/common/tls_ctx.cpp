/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/internal/tls_ctx.hpp"
#include "ph/errors.hpp"
#include "ph/log.hpp"
#include <openssl/err.h>

namespace ph::internal {

std::string drain_openssl_errors(const char* where) {
    std::string first;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (first.empty()) first = buf;
        ph::log_line(std::string("[TLS] error at ") + where + ": " + buf);
    }
    return first;
}

TlsContext::TlsContext(const ph::TlsIdentity& id) {
    _ctx = SSL_CTX_new(TLS_server_method());
    if (!_ctx) fail("SSL_CTX_new");

    // TLS1.2+
    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) fail("set_min_proto");

    if (SSL_CTX_use_certificate(_ctx, id.cert()) != 1) fail("use_certificate");
    if (SSL_CTX_use_PrivateKey(_ctx, id.key()) != 1) fail("use_privatekey");
    if (SSL_CTX_check_private_key(_ctx) != 1) fail("check_private_key");

    // intermediates shipped in the bundle
    if (STACK_OF(X509)* chain = id.chain()) {
        for (int i = 0; i < sk_X509_num(chain); ++i) {
            if (SSL_CTX_add1_chain_cert(_ctx, sk_X509_value(chain, i)) != 1) {
                fail("add1_chain_cert");
            }
        }
    }

    // server-authenticated only
    SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);

    // one response per connection; resumption buys nothing
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_OFF);
    if (SSL_CTX_set_num_tickets(_ctx, 0) != 1) fail("set_num_tickets");
}

TlsContext::~TlsContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsContext::fail(const char* where) {
    std::string why = drain_openssl_errors(where);
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
    throw ph::TlsError(std::string("TLS context setup failed at ") + where +
                       (why.empty() ? "" : ": " + why));
}

} // namespace ph::internal
