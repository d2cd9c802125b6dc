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
#include <cstdint>

namespace gw {

inline constexpr std::uint16_t kGeminiPort = 1965;

// Public client configuration. One exchange per perform_request().
struct ClientConfig {
    // Endpoint
    std::string   host = "gemini.circumlunar.space";
    std::uint16_t port = kGeminiPort;

    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect + TLS handshake
    int io_timeout_sec      = 10;  // per recv/send

    // Longest accepted meta field in a response header (bytes, without CRLF)
    std::size_t max_meta_len = 1024;

    // TLS. Gemini servers mostly present self-signed certificates, so peer
    // verification is opt-in. This library performs no certificate or
    // hostname checks beyond what is configured here.
    bool tls_verify_peer = false;
    std::string tls_ca_file;           // optional CA file path
    std::string tls_sni;               // optional SNI servername override
    std::string tls_client_cert_file;  // optional client certificate (6x)
    std::string tls_client_key_file;

    // Logging (empty: stderr only)
    std::string log_file;
};

} // namespace gw
