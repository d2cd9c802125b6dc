/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/header_reader.hpp"
#include "gw/internal/utils.hpp"
#include "gw/log.hpp"
#include <utility>

namespace gw::internal {

namespace {

// Map a failed read inside the header onto the error the caller sees.
bool header_io_failure(IoStatus st, const Stream& s, const char* what, gw::Error& err) {
    switch (st) {
        case IoStatus::Eof:
            return gw::fail(err, gw::ErrorCode::TruncatedHeader,
                            std::string("stream closed while reading ") + what);
        case IoStatus::Timeout:
            return gw::fail(err, gw::ErrorCode::Timeout,
                            std::string("timed out reading ") + what);
        case IoStatus::TooLong:
            return gw::fail(err, gw::ErrorCode::HeaderTooLong,
                            std::string(what) + " exceeds limit");
        default:
            return gw::fail(err, gw::ErrorCode::IoError,
                            std::string("reading ") + what + ": " + s.io_error());
    }
}

} // namespace

bool read_response_header(Stream& s,
                          std::size_t max_meta,
                          gw::ResponseHeader& out,
                          gw::Error& err)
{
    std::string status_buf;
    IoStatus st = s.read_exact(2, status_buf);
    if (st != IoStatus::Ok) return header_io_failure(st, s, "status", err);

    const unsigned char d0 = (unsigned char)status_buf[0];
    const unsigned char d1 = (unsigned char)status_buf[1];
    if (d0 < '0' || d0 > '9' || d1 < '0' || d1 > '9') {
        gw::log_line("[HEADER] malformed status bytes: " + escape_bytes(status_buf));
        return gw::fail(err, gw::ErrorCode::MalformedStatus,
                        "status is not two digits: \"" + escape_bytes(status_buf) + "\"");
    }

    const int raw = (d0 - '0') * 10 + (d1 - '0');
    gw::StatusCode status = gw::StatusCode::PermanentFailure;
    if (!gw::decode_status(raw, status)) {
        gw::log_line("[HEADER] unknown status " + std::to_string(raw));
        return gw::fail(err, gw::ErrorCode::UnknownStatus,
                        "unknown status " + std::to_string(raw));
    }

    std::string space;
    st = s.read_exact(1, space);
    if (st != IoStatus::Ok) return header_io_failure(st, s, "separator", err);
    if (space[0] != ' ') {
        return gw::fail(err, gw::ErrorCode::MalformedHeader,
                        "expected space after status, got \"" + escape_bytes(space) + "\"");
    }

    std::string meta;
    st = s.read_line(meta, max_meta);
    if (st == IoStatus::TooLong) {
        return gw::fail(err, gw::ErrorCode::HeaderTooLong,
                        "meta exceeds " + std::to_string(max_meta) + " bytes");
    }
    if (st != IoStatus::Ok) return header_io_failure(st, s, "meta", err);

    out.status = status;
    out.meta = std::move(meta);
    return true;
}

} // namespace gw::internal
