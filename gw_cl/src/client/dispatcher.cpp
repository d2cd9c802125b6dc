/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/dispatcher.hpp"
#include "gw/internal/utils.hpp"
#include "gw/log.hpp"
#include <utility>

namespace gw::internal {

namespace {

bool handle_success(const gw::ResponseHeader& h, Stream& s,
                    gw::DispatchOutcome& out, gw::Error& err)
{
    // Only the exact "text/" prefix of the raw meta qualifies.
    if (!starts_with(h.meta, "text/")) {
        gw::log_line("[DISPATCH] refusing non-text body: " + h.meta);
        out.kind = gw::OutcomeKind::UnsupportedMediaType;
        out.status = h.status;
        out.meta = h.meta;
        out.body.clear();
        return true;
    }

    std::string body;
    const IoStatus st = s.read_to_end(body);
    if (st == IoStatus::Timeout) {
        return gw::fail(err, gw::ErrorCode::Timeout, "timed out reading body");
    }
    if (st != IoStatus::Ok) {
        return gw::fail(err, gw::ErrorCode::BodyReadError,
                        std::string(io_status_name(st)) + ": " + s.io_error());
    }

    std::string type, charset;
    split_media_type(h.meta, type, charset);

    // Gemini's default charset is UTF-8. Other declared charsets pass as-is.
    if (charset.empty() || charset == "utf-8" || charset == "utf8") {
        if (!is_valid_utf8(body)) {
            return gw::fail(err, gw::ErrorCode::InvalidEncoding, "body is not valid UTF-8");
        }
    } else if (charset == "us-ascii" || charset == "ascii") {
        if (!is_7bit_ascii(body)) {
            return gw::fail(err, gw::ErrorCode::InvalidEncoding, "body is not 7-bit ASCII");
        }
    }

    out.kind = gw::OutcomeKind::Body;
    out.status = h.status;
    out.meta = h.meta;
    out.body = std::move(body);
    return true;
}

} // namespace

bool dispatch(const gw::ResponseHeader& h,
              Stream& s,
              gw::DispatchOutcome& out,
              gw::Error& err)
{
    if (gw::is_success(h.status)) {
        return handle_success(h, s, out, err);
    }

    out.status = h.status;
    out.meta = h.meta;
    out.body.clear();

    if (gw::is_redirect(h.status)) {
        out.kind = gw::OutcomeKind::Redirect;
    } else if (gw::is_input_required(h.status)) {
        out.kind = gw::OutcomeKind::InputRequested;
    } else if (gw::is_temporary_failure(h.status) ||
               gw::is_permanent_failure(h.status) ||
               gw::is_cert_error(h.status)) {
        out.kind = gw::OutcomeKind::Failure;
    } else {
        gw::log_line(std::string("[DISPATCH] unhandled status ") + gw::status_name(h.status));
        out.kind = gw::OutcomeKind::UnhandledStatus;
    }
    return true;
}

} // namespace gw::internal
