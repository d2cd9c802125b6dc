/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#pragma once
#include <cstdint>

namespace gw {

// Gemini response status codes. Closed set; anything else fails to decode.
enum class StatusCode : std::uint8_t {
    /* 1X */
    Input                     = 10,
    SensitiveInput            = 11,
    /* 2X */
    Success                   = 20,
    /* 3X */
    RedirectTemporary         = 30,
    RedirectPermanent         = 31,
    /* 4X */
    TemporaryFailure          = 40,
    ServerUnavailable         = 41,
    CgiError                  = 42,
    ProxyError                = 43,
    SlowDown                  = 44,
    /* 5X */
    PermanentFailure          = 50,
    NotFound                  = 51,
    Gone                      = 52,
    ProxyRequestRefused       = 53,
    BadRequest                = 59,
    /* 6X */
    ClientCertificateRequired = 60,
    CertificateNotAuthorised  = 61,
    CertificateNotValid       = 62
};

// Maps a raw two-digit value onto StatusCode. Returns false for any value
// outside the 18 defined codes; `out` is left untouched in that case.
bool decode_status(int raw, StatusCode& out);

inline int status_value(StatusCode s) { return static_cast<int>(s); }

// "NotFound", "Success", ...
const char* status_name(StatusCode s);

// Band predicates
bool is_input_required(StatusCode s);    // 1x
bool is_success(StatusCode s);           // 2x
bool is_redirect(StatusCode s);          // 3x
bool is_temporary_failure(StatusCode s); // 4x
bool is_permanent_failure(StatusCode s); // 5x
bool is_cert_error(StatusCode s);        // 6x

} // namespace gw
