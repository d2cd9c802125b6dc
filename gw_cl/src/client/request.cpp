/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/request.hpp"
#include "gw/internal/utils.hpp"

namespace gw::internal {

bool build_request(const std::string& host,
                   const std::string& resource,
                   std::string& out,
                   gw::Error& err)
{
    if (host.empty()) {
        return gw::fail(err, gw::ErrorCode::MalformedRequest, "empty host");
    }
    if (has_line_break(host)) {
        return gw::fail(err, gw::ErrorCode::MalformedRequest,
                        "line break in host: " + escape_bytes(host));
    }
    if (has_line_break(resource)) {
        return gw::fail(err, gw::ErrorCode::MalformedRequest,
                        "line break in resource: " + escape_bytes(resource));
    }

    std::string url;
    if (!starts_with(host, kGeminiScheme)) url = kGeminiScheme;
    url += host;
    url += resource;

    if (url.size() > kMaxRequestUrl) {
        return gw::fail(err, gw::ErrorCode::MalformedRequest,
                        "request URL is " + std::to_string(url.size()) +
                        " bytes, limit is " + std::to_string(kMaxRequestUrl));
    }

    out = url + "\r\n";
    return true;
}

} // namespace gw::internal
