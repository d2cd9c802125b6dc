/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/exchange.hpp"
#include "gw/internal/header_reader.hpp"
#include "gw/internal/dispatcher.hpp"
#include <utility>

namespace gw::internal {

bool run_exchange(Stream& s,
                  const std::string& request_line,
                  std::size_t max_meta,
                  gw::DispatchOutcome& out,
                  gw::Error& err)
{
    const IoStatus st = s.write_all(request_line);
    if (st == IoStatus::Timeout) {
        return gw::fail(err, gw::ErrorCode::Timeout, "timed out sending request");
    }
    if (st != IoStatus::Ok) {
        return gw::fail(err, gw::ErrorCode::IoError,
                        std::string("sending request: ") + io_status_name(st) + " " + s.io_error());
    }

    gw::ResponseHeader header;
    if (!read_response_header(s, max_meta, header, err)) return false;

    gw::DispatchOutcome result;
    if (!dispatch(header, s, result, err)) return false;
    out = std::move(result);
    return true;
}

} // namespace gw::internal
