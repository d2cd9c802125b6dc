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
#include <cstdint>
#include "gw/client_config.hpp"

namespace gw {

struct GeminiUrl {
    std::string   host;
    std::uint16_t port = kGeminiPort;
    std::string   resource = "/";   // path plus optional "?query"
};

// "gemini://host[:port][/path][?query]". Other schemes are rejected.
bool parse_gemini_url(const std::string& url, GeminiUrl& out);

// Command-line style host: "example.org", "example.org:1966", "[::1]:1966",
// a bare IPv6 literal, or a full gemini:// URL. Port defaults to 1965.
bool parse_host_arg(const std::string& arg, GeminiUrl& out);

// Resolve a 3x target against the URL that produced it. Accepts absolute
// gemini:// URLs, absolute paths and paths relative to base's directory.
bool resolve_redirect(const GeminiUrl& base, const std::string& target, GeminiUrl& out);

// Unreserved characters (RFC 3986) kept, everything else as %XX.
std::string percent_encode(const std::string& s);

} // namespace gw
