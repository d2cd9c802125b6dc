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
#include "gw/error.hpp"

namespace gw::internal {

inline constexpr const char* kGeminiScheme = "gemini://";

// Longest URL a Gemini request may carry (without the CRLF).
inline constexpr std::size_t kMaxRequestUrl = 1024;

// "gemini://<host><resource>\r\n", or "<host><resource>\r\n" when host
// already carries the scheme. MalformedRequest on empty host, CR/LF in
// either argument, or an over-long URL.
bool build_request(const std::string& host,
                   const std::string& resource,
                   std::string& out,
                   gw::Error& err);

} // namespace gw::internal
