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
#include <cstdint>
#include <functional>
#include <string>
#include <openssl/ssl.h>
#include "ph/server_config.hpp"
#include "ph/static_document.hpp"
#include "ph/types.hpp"
#include "ph/internal/conn_set.hpp"

namespace ph::internal {

enum class ConnState { Opened, Receiving, Responding, Closed };

// Why a connection ended before (or instead of) a successful response.
enum class ConnError {
    None,
    Handshake,   // SSL_accept failed: untrusted cert, plain HTTP, scanner
    Tls,         // TLS protocol error after the handshake
    Timeout,     // idle receive/send timeout
    Decode,      // request bytes are not UTF-8 text
    PeerReset,   // socket error from the peer
    Send,        // response could not be written
    Cancelled    // server stop shut the socket down
};

const char* to_string(ConnError e);

// Handshake/TLS noise from browsers probing a self-signed certificate and
// bulk cancellation are expected; everything else deserves a warning.
bool is_reported(ConnError e);

using EmitFn = std::function<void(EventKind kind, const std::string& msg, std::uint64_t conn_id)>;

// One accepted socket, handled start to finish on a single thread:
//   Opened -> Receiving -> Responding -> Closed
// Any step may short-circuit to Closed with an error.
// The socket must already be registered in `set` under `id`.
class TlsConnection {
public:
    TlsConnection(int fd,
                  std::uint64_t id,
                  std::string peer,
                  SSL_CTX* ctx,
                  const ph::StaticDocument& doc,
                  const ph::ServerConfig& cfg,
                  ConnectionSet& set,
                  EmitFn emit);
    ~TlsConnection();

    // Runs the whole state machine; returns once the connection is Closed.
    void run();

    // Releases SSL + socket; safe to call more than once.
    void close();

    ConnState state() const { return _state; }
    ConnError error() const { return _error; }

    // non-copyable
    TlsConnection(const TlsConnection&) = delete;
    TlsConnection& operator=(const TlsConnection&) = delete;

private:
    int _fd;
    std::uint64_t _id;
    std::string _peer;
    SSL_CTX* _ctx;
    const ph::StaticDocument& _doc;
    const ph::ServerConfig& _cfg;
    ConnectionSet& _set;
    EmitFn _emit;

    SSL* _ssl = nullptr;
    bool _tls_healthy = false;  // close_notify may be sent
    ConnState _state = ConnState::Opened;
    ConnError _error = ConnError::None;

    bool open();
    bool receive(std::string& req);
    bool respond();

    ConnError classify(int ret);
    void fail(ConnError e, const std::string& detail);
};

} // namespace ph::internal
