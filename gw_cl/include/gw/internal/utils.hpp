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
#include <cstddef>

namespace gw::internal {

void trim_inplace(std::string& s);
std::string lower_copy(std::string s);
bool starts_with(const std::string& s, const char* prefix);
bool has_line_break(const std::string& s);

// "text/gemini; charset=utf-8; lang=en" -> type "text/gemini" (lower-cased),
// charset "utf-8" (lower-cased, empty when absent).
void split_media_type(const std::string& meta, std::string& type, std::string& charset);

bool is_valid_utf8(const std::string& s);
bool is_7bit_ascii(const std::string& s);

// Printable rendering of raw protocol bytes for error messages.
std::string escape_bytes(const std::string& s);

} // namespace gw::internal
