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
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <openssl/ssl.h>
#include "ph/observer.hpp"

namespace ph::test {

// mkdtemp() directory removed (recursively) on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    const std::string& path() const { return _path; }
    std::string file(const std::string& name) const { return _path + "/" + name; }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

private:
    std::string _path;
};

void write_file(const std::string& path, const std::string& bytes);

// Self-signed RSA cert + key packed as a PKCS#12 file protected by `passphrase`.
// Returns false if OpenSSL could not produce it.
bool write_p12_bundle(const std::string& path, const std::string& passphrase,
                      const char* common_name = "pagehost.test");

// Blocking TLS client for 127.0.0.1 (no certificate verification).
class TlsClient {
public:
    explicit TlsClient(uint16_t port, int io_timeout_sec = 5);
    ~TlsClient();

    bool connected() const { return _ssl != nullptr; }
    bool write(const std::string& bytes);

    // Reads until close_notify, EOF, error or timeout.
    std::string read_all();

    void close();

    TlsClient(const TlsClient&) = delete;
    TlsClient& operator=(const TlsClient&) = delete;

private:
    int _fd = -1;
    SSL_CTX* _ctx = nullptr;
    SSL* _ssl = nullptr;
};

// Plain TCP connection to 127.0.0.1:port, -1 on failure.
int tcp_connect(uint16_t port, int io_timeout_sec = 5);

// Sends `bytes` over plain TCP and returns everything read until EOF.
std::string plain_exchange(uint16_t port, const std::string& bytes);

// Sends a request over TLS and returns the raw response.
std::string https_exchange(uint16_t port, const std::string& request);

struct ParsedResponse {
    std::string status_line;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::string header(const std::string& name) const;
};

// Splits a raw HTTP/1.1 response; false if there is no header terminator.
bool parse_response(const std::string& raw, ParsedResponse& out);

// Observer that records everything and lets tests wait for conditions.
class RecordingObserver : public ph::ServerObserver {
public:
    void on_state(const ph::ServerStatus& status) override;
    void on_event(const ph::Event& ev) override;

    std::vector<ph::Event> events() const;
    std::vector<ph::ServerStatus> states() const;

    std::size_t count(ph::EventKind kind) const;
    std::size_t count_containing(ph::EventKind kind, const std::string& needle) const;

    bool wait_for_state(ph::ServerState state,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5));
    bool wait_for_event(ph::EventKind kind, const std::string& needle,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void clear();

private:
    bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::vector<ph::Event> _events;
    std::vector<ph::ServerStatus> _states;
};

// Polls `pred` every 10ms until it holds or `timeout` elapses.
bool eventually(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

} // namespace ph::test
