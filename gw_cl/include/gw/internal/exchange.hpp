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
#include "gw/error.hpp"
#include "gw/response.hpp"
#include "gw/internal/stream.hpp"

namespace gw::internal {

// Write the request line, read the header, dispatch. The stream is spent
// afterwards whatever the result.
bool run_exchange(Stream& s,
                  const std::string& request_line,
                  std::size_t max_meta,
                  gw::DispatchOutcome& out,
                  gw::Error& err);

} // namespace gw::internal
