/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/internal/net_iface.hpp"
#include "ph/log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/types.h>
#include <sys/socket.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>

namespace ph::internal {

std::vector<InterfaceAddr> list_ipv4_interfaces() {
    std::vector<InterfaceAddr> out;
    ifaddrs* head = nullptr;
    if (::getifaddrs(&head) != 0) {
        ph::log_line(std::string("[NET] getifaddrs() failed: ") + std::strerror(errno));
        return out;
    }

    for (ifaddrs* p = head; p; p = p->ifa_next) {
        if (!p->ifa_addr || p->ifa_addr->sa_family != AF_INET) continue;

        char host[NI_MAXHOST] = {0};
        int rc = ::getnameinfo(p->ifa_addr, sizeof(sockaddr_in),
                               host, sizeof(host), nullptr, 0, NI_NUMERICHOST);
        if (rc != 0) {
            ph::log_line(std::string("[NET] getnameinfo(") + p->ifa_name + ") failed: " +
                         gai_strerror(rc));
            continue;
        }

        InterfaceAddr a;
        a.name = p->ifa_name ? p->ifa_name : "";
        a.ip   = host;
        a.up   = (p->ifa_flags & IFF_UP) != 0;
        out.push_back(std::move(a));
    }

    ::freeifaddrs(head);
    return out;
}

std::optional<std::string> select_interface_address(const std::vector<InterfaceAddr>& table,
                                                    const std::string& name)
{
    std::optional<std::string> found;
    for (const auto& a : table) {
        if (a.up && a.name == name && !a.ip.empty()) found = a.ip;
    }
    return found;
}

std::optional<std::string> resolve_local_address(const std::string& name) {
    return select_interface_address(list_ipv4_interfaces(), name);
}

} // namespace ph::internal
