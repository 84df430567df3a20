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
#include <chrono>
#include <string>

namespace ph {
// Local wall-clock time of `tp` as "HH:MM:SS".
std::string local_hms(std::chrono::system_clock::time_point tp);

// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();
} // namespace ph
