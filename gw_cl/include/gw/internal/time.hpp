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

namespace gw::internal {

// "YYYY-MM-DDTHH:MM:SSZ"
std::string utc_iso8601_now();

} // namespace gw::internal
