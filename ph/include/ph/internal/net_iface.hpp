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
#include <optional>
#include <string>
#include <vector>

namespace ph::internal {

struct InterfaceAddr {
    std::string name;  // "wlan0", "en0", "lo"
    std::string ip;    // dotted IPv4
    bool up = false;
};

// IPv4 entries of the current interface table (getifaddrs).
// Enumeration failure is logged and yields an empty list.
std::vector<InterfaceAddr> list_ipv4_interfaces();

// Last entry named `name` that is up (later table entries win).
std::optional<std::string> select_interface_address(const std::vector<InterfaceAddr>& table,
                                                    const std::string& name);

// list + select; never throws.
std::optional<std::string> resolve_local_address(const std::string& name);

} // namespace ph::internal
