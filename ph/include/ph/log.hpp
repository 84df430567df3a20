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
#include <string>
#include "ph/types.hpp"

namespace ph {

// Thread-safe logging (to file + stdout).
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// "[WARN] [3] message" style rendering of a server event.
std::string format_event(const Event& e);

} // namespace ph
