/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/client.hpp"
#include "gw/log.hpp"

#include "gw/internal/request.hpp"
#include "gw/internal/exchange.hpp"
#include "gw/internal/tls_cli_ctx.hpp"
#include "gw/internal/tls_stream.hpp"
#include "gw/internal/utils.hpp"

#include <memory>
#include <utility>

namespace {

// "GEMINI://example.org" -> "gemini://example.org", so that the request
// line and the connect target agree on where the scheme ends.
std::string normalize_scheme(const std::string& host) {
    if (gw::internal::lower_copy(host.substr(0, 9)) == gw::internal::kGeminiScheme) {
        return gw::internal::kGeminiScheme + host.substr(9);
    }
    return host;
}

// "gemini://example.org" -> "example.org"
std::string connect_host(const std::string& host) {
    if (gw::internal::starts_with(host, gw::internal::kGeminiScheme)) {
        return host.substr(9);
    }
    return host;
}

} // namespace

namespace gw {

struct Client::Impl {
    ClientConfig cfg;
    std::unique_ptr<internal::TlsClientContext> tls;

    explicit Impl(const ClientConfig& c): cfg(c) {
        cfg.host = normalize_scheme(cfg.host);
        if (!cfg.log_file.empty()) gw::set_log_file(cfg.log_file);
        tls = std::make_unique<internal::TlsClientContext>(cfg);
        if (!tls->ok()) {
            gw::log_line("[CLIENT] TLS context: " + tls->error());
        }
    }

    // Authority for the request line; the port only appears when it is not
    // the protocol default.
    std::string request_authority() const {
        if (cfg.port == kGeminiPort) return cfg.host;
        return cfg.host + ":" + std::to_string(cfg.port);
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

const ClientConfig& Client::config() const { return _p->cfg; }

bool Client::perform_request(const std::string& resource,
                             DispatchOutcome& out,
                             Error& err)
{
    std::string request_line;
    if (!internal::build_request(_p->request_authority(), resource, request_line, err)) {
        gw::log_line("[CLIENT] " + err.message);
        return false;
    }

    if (!_p->tls->ok()) {
        return fail(err, ErrorCode::TlsError, _p->tls->error());
    }

    gw::log_line("[CLIENT] Requesting " + request_line.substr(0, request_line.size() - 2));

    // One connection per exchange; closed when `stream` goes out of scope.
    internal::TlsStream stream;
    if (!stream.open(*_p->tls, connect_host(_p->cfg.host), _p->cfg.port, _p->cfg, err)) {
        return false;
    }

    if (!internal::run_exchange(stream, request_line, _p->cfg.max_meta_len, out, err)) {
        gw::log_line(std::string("[CLIENT] exchange failed: ") + error_code_name(err.code) +
                     ": " + err.message);
        return false;
    }

    gw::log_line(std::string("[CLIENT] ") + std::to_string(status_value(out.status)) + " " +
                 status_name(out.status) + " -> " + outcome_kind_name(out.kind));
    return true;
}

bool perform_request(const std::string& host,
                     std::uint16_t port,
                     const std::string& resource,
                     DispatchOutcome& out,
                     Error& err)
{
    ClientConfig cfg;
    cfg.host = host;
    cfg.port = port;
    Client cli(cfg);
    return cli.perform_request(resource, out, err);
}

} // namespace gw
