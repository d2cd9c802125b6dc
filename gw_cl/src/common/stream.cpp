/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/stream.hpp"

namespace gw::internal {

IoStatus Stream::write_all(const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        std::size_t n = 0;
        const IoStatus st = send_some(data.data() + off, data.size() - off, n);
        if (st != IoStatus::Ok) return st;
        if (n == 0) return IoStatus::Eof;
        off += n;
    }
    return IoStatus::Ok;
}

IoStatus Stream::fill() {
    if (_rpos > 0 && _rpos == _rbuf.size()) {
        _rbuf.clear();
        _rpos = 0;
    }
    char buf[1024];
    std::size_t got = 0;
    const IoStatus st = recv_some(buf, sizeof(buf), got);
    if (st != IoStatus::Ok) return st;
    if (got == 0) return IoStatus::Eof;
    _rbuf.append(buf, buf + got);
    return IoStatus::Ok;
}

IoStatus Stream::read_exact(std::size_t n, std::string& out) {
    while (buffered() < n) {
        const IoStatus st = fill();
        if (st != IoStatus::Ok) return st;
    }
    out.assign(_rbuf, _rpos, n);
    _rpos += n;
    return IoStatus::Ok;
}

IoStatus Stream::read_line(std::string& out, std::size_t max_len) {
    std::size_t scanned = 0; // relative to _rpos
    for (;;) {
        const std::size_t nl = _rbuf.find('\n', _rpos + scanned);
        if (nl != std::string::npos) {
            std::size_t end = nl;
            if (end > _rpos && _rbuf[end - 1] == '\r') --end;
            if (end - _rpos > max_len) return IoStatus::TooLong;
            out.assign(_rbuf, _rpos, end - _rpos);
            _rpos = nl + 1;
            return IoStatus::Ok;
        }
        // max_len bytes plus a possible '\r' and still no newline
        if (buffered() > 0 && buffered() - 1 > max_len) return IoStatus::TooLong;
        scanned = buffered();
        const IoStatus st = fill();
        if (st != IoStatus::Ok) return st;
    }
}

IoStatus Stream::read_to_end(std::string& out) {
    std::string acc(_rbuf, _rpos);
    _rbuf.clear();
    _rpos = 0;

    char buf[4096];
    for (;;) {
        std::size_t got = 0;
        const IoStatus st = recv_some(buf, sizeof(buf), got);
        if (st == IoStatus::Eof) break;
        if (st != IoStatus::Ok) return st;
        if (got == 0) break;
        acc.append(buf, buf + got);
    }
    out.swap(acc);
    return IoStatus::Ok;
}

const char* io_status_name(IoStatus s) {
    switch (s) {
        case IoStatus::Ok:      return "ok";
        case IoStatus::Eof:     return "end of stream";
        case IoStatus::Timeout: return "timeout";
        case IoStatus::TooLong: return "line too long";
        case IoStatus::Error:   return "I/O error";
    }
    return "unknown";
}

} // namespace gw::internal
