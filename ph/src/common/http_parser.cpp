/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/internal/http_parser.hpp"
#include <sstream>

namespace ph::internal {

bool is_valid_utf8(const char* p, std::size_t n) {
    const unsigned char* s = reinterpret_cast<const unsigned char*>(p);
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t len;
        unsigned char lo = 0x80, hi = 0xBF;  // bounds for the 2nd byte
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }  // no surrogates
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }
        else return false;

        if (i + len > n) return false;
        if (s[i + 1] < lo || s[i + 1] > hi) return false;
        for (std::size_t k = 2; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

std::string first_request_line(const std::string& req) {
    std::size_t e = req.find("\r\n");
    if (e == std::string::npos) return req;
    return req.substr(0, e);
}

bool is_logged_request_line(const std::string& line) {
    return line.compare(0, 3, "GET") == 0 || line.compare(0, 4, "POST") == 0;
}

std::string utf8_prefix(const std::string& s, std::size_t max_chars) {
    std::size_t i = 0, chars = 0;
    while (i < s.size() && chars < max_chars) {
        ++i;
        while (i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) ++i;
        ++chars;
    }
    return s.substr(0, i);
}

std::string build_static_response(const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 200 OK\r\n";
    oss << "Content-Type: text/html; charset=utf-8\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";
    oss << "Access-Control-Allow-Origin: *\r\n";
    oss << "\r\n";
    oss << body;
    return oss.str();
}

} // namespace ph::internal
