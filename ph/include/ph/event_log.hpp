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
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "ph/observer.hpp"

namespace ph {

// Operator-facing log: the most recent `cap` events, oldest evicted first.
class EventLog : public ServerObserver {
public:
    struct Entry {
        EventKind   kind;
        std::string text;  // "[HH:MM:SS] message"
    };

    // echo = also write every entry through log_line()
    explicit EventLog(std::size_t cap = 100, bool echo = true);

    void on_state(const ServerStatus& status) override;
    void on_event(const Event& ev) override;

    std::vector<Entry> entries() const;
    std::size_t size() const;
    ServerStatus last_status() const;

    // Drops every entry, then records that the log was cleared.
    void clear();

private:
    void append_unlocked(const Event& ev);

    const std::size_t _cap;
    const bool _echo;
    mutable std::mutex _mtx;
    std::deque<Entry> _entries;
    ServerStatus _status;
};

} // namespace ph
