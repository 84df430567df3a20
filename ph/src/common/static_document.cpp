/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/static_document.hpp"

#include <fstream>
#include <iterator>

namespace ph {

static std::string fallback_page(const std::string& path) {
    return "<!DOCTYPE html>\n"
           "<html><body>\n"
           "<h1>" + path + " not found</h1>\n"
           "<p>Make sure " + path + " is shipped next to the server.</p>\n"
           "</body></html>\n";
}

StaticDocument StaticDocument::load(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return StaticDocument(fallback_page(path), true);
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return StaticDocument(fallback_page(path), true);
    }
    return StaticDocument(std::move(bytes));
}

} // namespace ph
