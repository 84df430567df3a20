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
#include <cstdint>
#include <string>

namespace ph {

// Listener lifecycle as seen from the outside.
enum class ServerState {
    Stopped,
    Starting,
    Running,
    Failed
};

// Read-only snapshot handed to observers.
struct ServerStatus {
    ServerState state = ServerState::Stopped;
    std::string url;     // only while Running
    std::string reason;  // only while Failed
};

enum class EventKind {
    Info,
    Success,
    Warning,
    Error,
    Connection
};

struct Event {
    EventKind   kind = EventKind::Info;
    std::string message;
    std::uint64_t conn_id = 0;  // 0 = not tied to a connection
    std::chrono::system_clock::time_point timestamp{};
};

const char* to_string(ServerState s);
const char* to_string(EventKind k);

} // namespace ph
