/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/response.hpp"

namespace gw {

const char* outcome_kind_name(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::Body:                 return "Body";
        case OutcomeKind::UnsupportedMediaType: return "UnsupportedMediaType";
        case OutcomeKind::Redirect:             return "Redirect";
        case OutcomeKind::InputRequested:       return "InputRequested";
        case OutcomeKind::Failure:              return "Failure";
        case OutcomeKind::UnhandledStatus:      return "UnhandledStatus";
    }
    return "Unknown";
}

} // namespace gw
