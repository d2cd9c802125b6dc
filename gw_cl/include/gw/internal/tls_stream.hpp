/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <memory>
#include <string>
#include <cstdint>
#include "gw/client_config.hpp"
#include "gw/error.hpp"
#include "gw/internal/stream.hpp"
#include "gw/internal/tcp_conn.hpp"
#include "gw/internal/tls_cli_ctx.hpp"

namespace gw::internal {

// Stream over a TLS session on its own TCP connection. One per exchange.
class TlsStream : public Stream {
public:
    TlsStream() = default;
    ~TlsStream() override;

    // Connect, handshake (bounded by cfg.connect_timeout_sec) and, when
    // cfg.tls_verify_peer is set, check chain and host name.
    bool open(const TlsClientContext& tls,
              const std::string& host,
              std::uint16_t port,
              const gw::ClientConfig& cfg,
              gw::Error& err);

    void close();

protected:
    IoStatus send_some(const char* d, std::size_t len, std::size_t& sent) override;
    IoStatus recv_some(char* d, std::size_t cap, std::size_t& got) override;

private:
    IoStatus classify_failure(int rc, const char* op);

    TcpConn _tcp;
    std::unique_ptr<SSL, void(*)(SSL*)> _ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
};

} // namespace gw::internal
