/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/tls_cli_ctx.hpp"
#include "gw/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace gw::internal {

std::string drain_openssl_errors(const char* where) {
    std::string last;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        last = buf;
        gw::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
    return last;
}

TlsClientContext::TlsClientContext(const gw::ClientConfig& cfg) {
    OPENSSL_init_ssl(0, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        _error = "SSL_CTX_new: " + drain_openssl_errors("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        drain_openssl_errors("set_min_proto");
    }

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Gemini servers end the body by closing the connection, often without
    // close_notify. Report that as a clean end of stream.
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    // Trust store (only consulted when verifying peers)
    if (cfg.tls_verify_peer) {
        if (!cfg.tls_ca_file.empty()) {
            if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
                _error = "load CA " + cfg.tls_ca_file + ": " +
                         drain_openssl_errors("load_verify_locations(CA)");
            }
        } else if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            drain_openssl_errors("set_default_verify_paths");
        }
    }

    // Optional client certificate
    if (!cfg.tls_client_cert_file.empty() && !cfg.tls_client_key_file.empty()) {
        if (SSL_CTX_use_certificate_file(_ctx, cfg.tls_client_cert_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            _error = "client certificate: " + drain_openssl_errors("use_certificate_file(client)");
        } else if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_client_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            _error = "client key: " + drain_openssl_errors("use_privatekey_file(client)");
        } else if (SSL_CTX_check_private_key(_ctx) != 1) {
            _error = "client key mismatch: " + drain_openssl_errors("check_private_key(client)");
        }
    }

    // Verification
    if (cfg.tls_verify_peer) {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

} // namespace gw::internal
