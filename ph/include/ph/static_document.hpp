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
#include <string>
#include <utility>

namespace ph {

// The single HTML payload served for every request.
class StaticDocument {
public:
    // Reads `path`; on failure holds a generated page telling the operator
    // the file is missing (is_fallback() == true).
    static StaticDocument load(const std::string& path);

    explicit StaticDocument(std::string bytes, bool fallback = false)
        : _bytes(std::move(bytes)), _fallback(fallback) {}

    const std::string& bytes() const { return _bytes; }
    std::size_t size() const { return _bytes.size(); }
    bool is_fallback() const { return _fallback; }

private:
    std::string _bytes;
    bool _fallback = false;
};

} // namespace ph
