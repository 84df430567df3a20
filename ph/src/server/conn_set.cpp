/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/internal/conn_set.hpp"

#include <sys/socket.h>

namespace ph::internal {

ConnectionSet::ConnectionSet(std::size_t cap)
    : _cap(cap == 0 ? 1 : cap)
{}

bool ConnectionSet::add(std::uint64_t id, int fd) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_cancelled || _fds.size() >= _cap) return false;
    _fds[id] = fd;
    return true;
}

void ConnectionSet::remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_fds.erase(id) > 0 && _fds.empty()) {
        _cv.notify_all();
    }
}

void ConnectionSet::cancel_all() {
    std::lock_guard<std::mutex> lk(_mtx);
    _cancelled = true;
    // Wakes blocked SSL_accept/SSL_read/SSL_write; the owners close the fds.
    for (const auto& kv : _fds) {
        (void)::shutdown(kv.second, SHUT_RDWR);
    }
}

bool ConnectionSet::cancelled() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _cancelled;
}

void ConnectionSet::wait_empty() {
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait(lk, [this] { return _fds.empty(); });
}

void ConnectionSet::reset() {
    std::lock_guard<std::mutex> lk(_mtx);
    _cancelled = false;
}

std::size_t ConnectionSet::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _fds.size();
}

} // namespace ph::internal
