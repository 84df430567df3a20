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
#include "ph/types.hpp"

namespace ph {

// Receives state snapshots and events published by the Server.
// Calls are serialised but come from whichever thread drove the change
// (caller of start()/stop(), the listener thread, connection threads).
// Implementations must not call back into Server::start()/stop().
class ServerObserver {
public:
    virtual ~ServerObserver() = default;

    virtual void on_state(const ServerStatus& status) = 0;
    virtual void on_event(const Event& ev) = 0;
};

} // namespace ph
