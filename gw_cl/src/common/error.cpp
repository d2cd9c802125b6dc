/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/error.hpp"
#include <utility>

namespace gw {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::ConnectionFailed:     return "ConnectionFailed";
        case ErrorCode::MalformedRequest:     return "MalformedRequest";
        case ErrorCode::TruncatedHeader:      return "TruncatedHeader";
        case ErrorCode::MalformedStatus:      return "MalformedStatus";
        case ErrorCode::UnknownStatus:        return "UnknownStatus";
        case ErrorCode::MalformedHeader:      return "MalformedHeader";
        case ErrorCode::HeaderTooLong:        return "HeaderTooLong";
        case ErrorCode::UnsupportedMediaType: return "UnsupportedMediaType";
        case ErrorCode::BodyReadError:        return "BodyReadError";
        case ErrorCode::InvalidEncoding:      return "InvalidEncoding";
        case ErrorCode::Timeout:              return "Timeout";
        case ErrorCode::IoError:              return "IoError";
        case ErrorCode::TlsError:             return "TlsError";
    }
    return "Unknown";
}

bool fail(Error& err, ErrorCode code, std::string message) {
    err.code = code;
    err.message = std::move(message);
    return false;
}

} // namespace gw
