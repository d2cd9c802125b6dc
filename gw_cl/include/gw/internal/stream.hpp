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
#include <utility>

namespace gw::internal {

enum class IoStatus {
    Ok,
    Eof,      // peer closed the stream
    Timeout,  // socket deadline expired
    TooLong,  // read_line(): no newline within the limit
    Error     // transport failure, see Stream::io_error()
};

// Byte stream for a single exchange. Reads go through an internal buffer so
// that a line read may pull more bytes than it returns; anything beyond the
// line stays buffered for the next call (e.g. the response body).
class Stream {
public:
    Stream() = default;
    virtual ~Stream() = default;

    // non-copyable
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    IoStatus write_all(const std::string& data);

    // Exactly n bytes, or Eof if the stream closes first.
    IoStatus read_exact(std::size_t n, std::string& out);

    // Bytes up to (excluding) '\n', with a trailing '\r' removed. TooLong if
    // the line exceeds max_len bytes; Eof if the stream closes before '\n'.
    IoStatus read_line(std::string& out, std::size_t max_len);

    // Everything up to end of stream, buffered bytes first.
    IoStatus read_to_end(std::string& out);

    std::size_t buffered() const { return _rbuf.size() - _rpos; }

    // Cause of the last Error/Timeout, for messages.
    const std::string& io_error() const { return _io_error; }

protected:
    // Ok implies sent > 0 / got > 0.
    virtual IoStatus send_some(const char* d, std::size_t len, std::size_t& sent) = 0;
    virtual IoStatus recv_some(char* d, std::size_t cap, std::size_t& got) = 0;

    void set_io_error(std::string e) { _io_error = std::move(e); }

private:
    IoStatus fill();

    std::string _rbuf;
    std::size_t _rpos = 0;
    std::string _io_error;
};

const char* io_status_name(IoStatus s);

} // namespace gw::internal
