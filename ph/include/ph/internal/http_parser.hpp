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

namespace ph::internal {

// Strict UTF-8 check (no overlongs, no surrogates, max U+10FFFF).
bool is_valid_utf8(const char* p, std::size_t n);

// Everything before the first CRLF (whole input if there is none).
std::string first_request_line(const std::string& req);

// Request lines worth an info event: "GET ..." / "POST ...".
bool is_logged_request_line(const std::string& line);

// At most `max_chars` Unicode code points (not grapheme clusters) of a valid
// UTF-8 string; a combining mark counts as its own character.
std::string utf8_prefix(const std::string& s, std::size_t max_chars);

// Full "HTTP/1.1 200 OK" response carrying `body` and closing the connection.
std::string build_static_response(const std::string& body);

} // namespace ph::internal
