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
#include "gw/error.hpp"

namespace gw::internal {

// RAII TCP connection with bounded connect and per-op I/O timeouts.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    // non-copyable
    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Tries every resolved address. ConnectionFailed, or Timeout when every
    // attempt ran into the connect deadline.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec, gw::Error& err);

    void close();
    int  fd() const { return _fd; }

private:
    int _fd = -1;
};

} // namespace gw::internal
