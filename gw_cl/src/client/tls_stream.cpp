/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/tls_stream.hpp"
#include "gw/log.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <limits>
#include <cstring>
#include <cerrno>

#include <poll.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <arpa/inet.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

enum class Handshake { Ok, Timeout, Failed };

// TLS handshake on a non-blocking socket, bounded by a deadline.
[[nodiscard]] Handshake ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec, std::string& why) {
    const int effective_timeout = std::max(1, timeout_sec);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return Handshake::Ok;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);
        const int e = errno;

        short ev = 0;
        if (ssl_err == SSL_ERROR_WANT_READ) ev = POLLIN;
        else if (ssl_err == SSL_ERROR_WANT_WRITE) ev = POLLOUT;
        else if (ssl_err == SSL_ERROR_SYSCALL && (e == EAGAIN || e == EWOULDBLOCK)) ev = POLLIN;
        else if (ssl_err == SSL_ERROR_SYSCALL && e == EINTR) continue;

        if (ev != 0) {
            const int ms = remaining_ms(deadline);
            if (ms <= 0) {
                why = "TLS handshake timed out";
                return Handshake::Timeout;
            }
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = ev;
            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, ms);
            } while (pr < 0 && errno == EINTR);

            if (pr == 0) {
                why = "TLS handshake timed out";
                return Handshake::Timeout;
            }
            if (pr < 0) {
                why = std::string("poll: ") + std::strerror(errno);
                return Handshake::Failed;
            }
            continue;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            why = std::string("SSL_connect syscall error: ") + (e ? std::strerror(e) : "connection closed");
        } else {
            why = "SSL_connect failed: ssl_error=" + std::to_string(ssl_err);
        }
        const std::string last = gw::internal::drain_openssl_errors("SSL_connect");
        if (!last.empty()) why += " (" + last + ")";
        return Handshake::Failed;
    }
}

// Host name without brackets, for SNI / name checks.
std::string bare_host(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

} // namespace

namespace gw::internal {

TlsStream::~TlsStream() { close(); }

bool TlsStream::open(const TlsClientContext& tls,
                     const std::string& host_in,
                     std::uint16_t port,
                     const gw::ClientConfig& cfg,
                     gw::Error& err)
{
    close();
    const std::string host = bare_host(host_in);

    if (!tls.ctx()) {
        return gw::fail(err, gw::ErrorCode::TlsError, "TLS context not ready: " + tls.error());
    }

    if (!_tcp.open(host, port, cfg.connect_timeout_sec, cfg.io_timeout_sec, err)) {
        return false;
    }

    SSL* s = SSL_new(tls.ctx());
    if (!s) {
        _tcp.close();
        return gw::fail(err, gw::ErrorCode::TlsError, "SSL_new: " + drain_openssl_errors("SSL_new"));
    }
    _ssl.reset(s);
    SSL_set_fd(s, _tcp.fd());

    const std::string sni = cfg.tls_sni.empty() ? host : cfg.tls_sni;
    unsigned char tmp[16];
    const bool is_ipv4 = (::inet_pton(AF_INET, sni.c_str(), tmp) == 1);
    const bool is_ipv6 = (!is_ipv4 && (::inet_pton(AF_INET6, sni.c_str(), tmp) == 1));

    // SNI must not carry an IP literal
    if (!is_ipv4 && !is_ipv6) {
        SSL_set_tlsext_host_name(s, sni.c_str());
    }

    // Chain validation alone does not check the name; configure it explicitly.
    if (cfg.tls_verify_peer) {
        X509_VERIFY_PARAM* param = SSL_get0_param(s);
        bool name_ok = param != nullptr;
        if (name_ok && (is_ipv4 || is_ipv6)) {
            name_ok = X509_VERIFY_PARAM_set1_ip_asc(param, sni.c_str()) == 1;
        } else if (name_ok) {
            name_ok = SSL_set1_host(s, sni.c_str()) == 1;
        }
        if (!name_ok) {
            close();
            return gw::fail(err, gw::ErrorCode::TlsError,
                            "cannot configure host verification for " + sni);
        }
    }

    const int fd = _tcp.fd();
    const int old_flags = ::fcntl(fd, F_GETFL, 0);
    if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
        close();
        return gw::fail(err, gw::ErrorCode::ConnectionFailed,
                        std::string("fcntl(O_NONBLOCK): ") + std::strerror(errno));
    }

    std::string why;
    const Handshake hs = ssl_connect_with_deadline(s, fd, cfg.connect_timeout_sec, why);

    // Restore blocking mode; SO_RCVTIMEO/SO_SNDTIMEO bound further I/O.
    (void)::fcntl(fd, F_SETFL, old_flags);

    if (hs != Handshake::Ok) {
        gw::log_line("[TLS-CLI] " + host + ": " + why);
        close();
        return gw::fail(err, hs == Handshake::Timeout ? gw::ErrorCode::Timeout
                                                      : gw::ErrorCode::ConnectionFailed, why);
    }

    if (cfg.tls_verify_peer) {
        const long vr = SSL_get_verify_result(s);
        if (vr != X509_V_OK) {
            const std::string why_v = std::string("TLS verify failed: ") + X509_verify_cert_error_string(vr);
            gw::log_line("[TLS-CLI] " + why_v);
            close();
            return gw::fail(err, gw::ErrorCode::ConnectionFailed, why_v);
        }
    }
    return true;
}

void TlsStream::close() {
    if (_ssl) {
        ERR_clear_error();
        if (SSL_is_init_finished(_ssl.get())) (void)SSL_shutdown(_ssl.get());
        _ssl.reset(nullptr);
    }
    _tcp.close();
}

IoStatus TlsStream::classify_failure(int rc, const char* op) {
    const int e = errno;
    const int ssl_err = SSL_get_error(_ssl.get(), rc);

    if (ssl_err == SSL_ERROR_ZERO_RETURN) return IoStatus::Eof;

    // SO_RCVTIMEO / SO_SNDTIMEO expired on the blocking socket
    if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE ||
        (ssl_err == SSL_ERROR_SYSCALL && (e == EAGAIN || e == EWOULDBLOCK))) {
        set_io_error(std::string(op) + " timed out");
        return IoStatus::Timeout;
    }

    if (ssl_err == SSL_ERROR_SYSCALL) {
        if (ERR_peek_error() == 0 && e == 0) {
            // peer closed without close_notify
            return IoStatus::Eof;
        }
        set_io_error(std::string(op) + ": " + std::strerror(e));
        drain_openssl_errors(op);
        return IoStatus::Error;
    }

    const std::string last = drain_openssl_errors(op);
    set_io_error(std::string(op) + ": ssl_error=" + std::to_string(ssl_err) +
                 (last.empty() ? "" : " (" + last + ")"));
    return IoStatus::Error;
}

IoStatus TlsStream::send_some(const char* d, std::size_t len, std::size_t& sent) {
    sent = 0;
    if (!_ssl) { set_io_error("not connected"); return IoStatus::Error; }
    const int chunk = static_cast<int>(std::min<std::size_t>(len, INT_MAX));
    for (;;) {
        ERR_clear_error();
        errno = 0;
        const int n = SSL_write(_ssl.get(), d, chunk);
        if (n > 0) { sent = static_cast<std::size_t>(n); return IoStatus::Ok; }
        if (errno == EINTR) continue;
        return classify_failure(n, "SSL_write");
    }
}

IoStatus TlsStream::recv_some(char* d, std::size_t cap, std::size_t& got) {
    got = 0;
    if (!_ssl) { set_io_error("not connected"); return IoStatus::Error; }
    const int chunk = static_cast<int>(std::min<std::size_t>(cap, INT_MAX));
    for (;;) {
        ERR_clear_error();
        errno = 0;
        const int n = SSL_read(_ssl.get(), d, chunk);
        if (n > 0) { got = static_cast<std::size_t>(n); return IoStatus::Ok; }
        if (errno == EINTR) continue;
        return classify_failure(n, "SSL_read");
    }
}

} // namespace gw::internal
