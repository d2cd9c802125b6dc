/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/tcp_conn.hpp"
#include "gw/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace gw::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   int connect_timeout_sec, int io_timeout_sec, gw::Error& err)
{
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        const std::string why = std::string("getaddrinfo(") + host + "): " + gai_strerror(rc);
        gw::log_line("[TCP] " + why);
        return gw::fail(err, gw::ErrorCode::ConnectionFailed, why);
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    bool all_timed_out = true;
    std::string last_why = "no usable address";
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { all_timed_out = false; last_why = std::strerror(errno); continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            all_timed_out = false;
            last_why = std::strerror(errno);
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd     = s;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);

            if (pr == 0) {
                last_why = "connect timed out";
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (pr < 0 || getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                all_timed_out = false;
                last_why = std::strerror(soerr ? soerr : errno);
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            all_timed_out = false;
            last_why = std::strerror(errno);
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{std::max(1, io_timeout_sec), 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        const std::string why = host + ":" + std::to_string(port) + ": " + last_why;
        gw::log_line("[TCP] connect failed: " + why);
        return gw::fail(err, all_timed_out ? gw::ErrorCode::Timeout : gw::ErrorCode::ConnectionFailed, why);
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

} // namespace gw::internal
