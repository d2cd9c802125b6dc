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
#include <string>
#include "gw/client_config.hpp"

namespace gw::internal {

// Minimal TLS client context. Loads system CA or custom CA and
// (optionally) a client certificate for servers answering 6x.
class TlsClientContext {
public:
    explicit TlsClientContext(const gw::ClientConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // false when the context or a configured client certificate failed to load
    bool ok() const { return _ctx != nullptr && _error.empty(); }
    const std::string& error() const { return _error; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    std::string _error;
};

// Drain the OpenSSL error queue into the log. Returns the last entry.
std::string drain_openssl_errors(const char* where);

} // namespace gw::internal
