/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#pragma once
#include <string>

namespace gw {

// Thread-safe logging (to stderr + optional file). Lines are timestamped.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace gw
