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
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace ph::internal {

// Sockets of the connections currently being handled, capped at `cap`.
// A connection must remove() itself before closing its fd; cancel_all()
// shuts down every registered fd under the same lock, so it never touches
// a descriptor that has already been closed and reused.
class ConnectionSet {
public:
    explicit ConnectionSet(std::size_t cap);

    // false when full or cancelled
    bool add(std::uint64_t id, int fd);
    void remove(std::uint64_t id);

    void cancel_all();
    bool cancelled() const;

    // Blocks until every registered connection has removed itself.
    void wait_empty();

    // Re-arms the set for a new run.
    void reset();

    std::size_t size() const;

private:
    const std::size_t _cap;
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::unordered_map<std::uint64_t, int> _fds;
    bool _cancelled = false;
};

} // namespace ph::internal
