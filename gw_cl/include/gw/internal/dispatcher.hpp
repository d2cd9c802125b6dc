/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#pragma once
#include "gw/error.hpp"
#include "gw/response.hpp"
#include "gw/internal/stream.hpp"

namespace gw::internal {

// Branch on the status band. Only a 2x text/* response consumes the rest of
// the stream; every other branch leaves the remaining bytes unread.
bool dispatch(const gw::ResponseHeader& h,
              Stream& s,
              gw::DispatchOutcome& out,
              gw::Error& err);

} // namespace gw::internal
