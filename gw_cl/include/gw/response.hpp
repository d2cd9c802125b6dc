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
#include "gw/status.hpp"

namespace gw {

// Decoded "<status> <meta>\r\n" line.
struct ResponseHeader {
    StatusCode status = StatusCode::PermanentFailure;
    std::string meta;   // MIME type (2x), URI (3x), prompt (1x), error text otherwise
};

enum class OutcomeKind {
    Body,                 // 2x text/*: body holds the decoded text
    UnsupportedMediaType, // 2x with a non-text media type; body not read
    Redirect,             // 3x: meta holds the target
    InputRequested,       // 1x: meta holds the prompt
    Failure,              // 4x/5x/6x: meta holds the server's detail
    UnhandledStatus
};

struct DispatchOutcome {
    OutcomeKind kind = OutcomeKind::UnhandledStatus;
    StatusCode status = StatusCode::PermanentFailure;
    std::string meta;
    std::string body;
};

const char* outcome_kind_name(OutcomeKind k);

} // namespace gw
