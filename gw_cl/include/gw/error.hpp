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

namespace gw {

enum class ErrorCode {
    ConnectionFailed,     // TCP connect or TLS handshake failed
    MalformedRequest,     // host/resource unusable for a request line
    TruncatedHeader,      // stream ended inside the response header
    MalformedStatus,      // status bytes are not two ASCII digits
    UnknownStatus,        // two digits, but not a defined status
    MalformedHeader,      // no single space after the status
    HeaderTooLong,        // meta exceeds ClientConfig::max_meta_len
    UnsupportedMediaType, // rendering only; dispatch reports it as an outcome
    BodyReadError,        // transport failed before end of body
    InvalidEncoding,      // body bytes do not match the declared charset
    Timeout,              // connect/read/write deadline expired
    IoError,              // transport failed while writing request or reading header
    TlsError              // TLS context could not be set up
};

struct Error {
    ErrorCode code = ErrorCode::IoError;
    std::string message;
};

const char* error_code_name(ErrorCode c);

// Fills `err` and returns false, so callers can `return fail(err, ...)`.
bool fail(Error& err, ErrorCode code, std::string message);

} // namespace gw
