/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include "gw/error.hpp"
#include "gw/response.hpp"
#include "gw/internal/stream.hpp"

namespace gw::internal {

// Read "<2 digits> <meta>\r\n" from s. On success the stream is positioned
// at the first body byte. `out` is only written on success.
bool read_response_header(Stream& s,
                          std::size_t max_meta,
                          gw::ResponseHeader& out,
                          gw::Error& err);

} // namespace gw::internal
