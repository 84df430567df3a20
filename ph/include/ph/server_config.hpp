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
#include <cstddef>
#include <cstdint>

namespace ph {

// Name of the interface whose address is advertised to other devices.
#if defined(__APPLE__)
inline constexpr const char* kDefaultWifiInterface = "en0";
#else
inline constexpr const char* kDefaultWifiInterface = "wlan0";
#endif

struct ServerConfig {
    // Core
    uint16_t    port = 8443;        // 0 = pick an ephemeral port
    std::string bind_addr = "0.0.0.0";

    // TLS identity (PKCS#12)
    std::string identity_file = "server.p12";
    std::string identity_passphrase = "123456";

    // Served page
    std::string document_file = "webRTC.html";

    // Address advertised in the URL
    std::string wifi_interface = kDefaultWifiInterface;

    // Connection supervision
    std::size_t max_connections  = 64;
    int         idle_timeout_sec = 10;
    std::size_t recv_max         = 65536;
    int         listen_backlog   = 128;

    // In-memory event log
    std::size_t log_cap = 100;
};

} // namespace ph
