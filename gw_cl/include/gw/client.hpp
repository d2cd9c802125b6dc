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
#include <memory>
#include <cstdint>
#include "gw/client_config.hpp"
#include "gw/error.hpp"
#include "gw/response.hpp"

namespace gw {

// Gemini client. Every perform_request() is a full exchange on a fresh
// TLS connection: connect, send request line, read header, dispatch, close.
class Client {
public:
    explicit Client(const ClientConfig& cfg);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // resource: path-and-query, e.g. "/docs/?q" (appended to cfg.host)
    bool perform_request(const std::string& resource,
                         DispatchOutcome& out,
                         Error& err);

    const ClientConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// One-shot exchange with default settings against host:port.
bool perform_request(const std::string& host,
                     std::uint16_t port,
                     const std::string& resource,
                     DispatchOutcome& out,
                     Error& err);

} // namespace gw
