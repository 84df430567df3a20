/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/event_log.hpp"
#include "ph/internal/time.hpp"
#include "ph/log.hpp"

namespace ph {

EventLog::EventLog(std::size_t cap, bool echo)
    : _cap(cap == 0 ? 1 : cap), _echo(echo)
{}

void EventLog::on_state(const ServerStatus& status) {
    std::lock_guard<std::mutex> lk(_mtx);
    _status = status;
}

void EventLog::on_event(const Event& ev) {
    std::lock_guard<std::mutex> lk(_mtx);
    append_unlocked(ev);
}

void EventLog::append_unlocked(const Event& ev) {
    Entry e{ev.kind, "[" + local_hms(ev.timestamp) + "] " + ev.message};
    if (_echo) {
        ph::log_line(std::string("[") + to_string(ev.kind) + "] " + e.text);
    }
    _entries.push_back(std::move(e));
    while (_entries.size() > _cap) {
        _entries.pop_front();
    }
}

std::vector<EventLog::Entry> EventLog::entries() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return std::vector<Entry>(_entries.begin(), _entries.end());
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _entries.size();
}

ServerStatus EventLog::last_status() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _status;
}

void EventLog::clear() {
    std::lock_guard<std::mutex> lk(_mtx);
    _entries.clear();
    Event ev;
    ev.kind = EventKind::Info;
    ev.message = "log cleared";
    ev.timestamp = std::chrono::system_clock::now();
    append_unlocked(ev);
}

} // namespace ph
