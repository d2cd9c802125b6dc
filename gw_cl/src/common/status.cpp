/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/status.hpp"

namespace gw {

bool decode_status(int raw, StatusCode& out) {
    switch (raw) {
        /* 1X */
        case 10: out = StatusCode::Input; return true;
        case 11: out = StatusCode::SensitiveInput; return true;
        /* 2X */
        case 20: out = StatusCode::Success; return true;
        /* 3X */
        case 30: out = StatusCode::RedirectTemporary; return true;
        case 31: out = StatusCode::RedirectPermanent; return true;
        /* 4X */
        case 40: out = StatusCode::TemporaryFailure; return true;
        case 41: out = StatusCode::ServerUnavailable; return true;
        case 42: out = StatusCode::CgiError; return true;
        case 43: out = StatusCode::ProxyError; return true;
        case 44: out = StatusCode::SlowDown; return true;
        /* 5X */
        case 50: out = StatusCode::PermanentFailure; return true;
        case 51: out = StatusCode::NotFound; return true;
        case 52: out = StatusCode::Gone; return true;
        case 53: out = StatusCode::ProxyRequestRefused; return true;
        case 59: out = StatusCode::BadRequest; return true;
        /* 6X */
        case 60: out = StatusCode::ClientCertificateRequired; return true;
        case 61: out = StatusCode::CertificateNotAuthorised; return true;
        case 62: out = StatusCode::CertificateNotValid; return true;
        default: return false;
    }
}

const char* status_name(StatusCode s) {
    switch (s) {
        case StatusCode::Input:                     return "Input";
        case StatusCode::SensitiveInput:            return "SensitiveInput";
        case StatusCode::Success:                   return "Success";
        case StatusCode::RedirectTemporary:         return "RedirectTemporary";
        case StatusCode::RedirectPermanent:         return "RedirectPermanent";
        case StatusCode::TemporaryFailure:          return "TemporaryFailure";
        case StatusCode::ServerUnavailable:         return "ServerUnavailable";
        case StatusCode::CgiError:                  return "CgiError";
        case StatusCode::ProxyError:                return "ProxyError";
        case StatusCode::SlowDown:                  return "SlowDown";
        case StatusCode::PermanentFailure:          return "PermanentFailure";
        case StatusCode::NotFound:                  return "NotFound";
        case StatusCode::Gone:                      return "Gone";
        case StatusCode::ProxyRequestRefused:       return "ProxyRequestRefused";
        case StatusCode::BadRequest:                return "BadRequest";
        case StatusCode::ClientCertificateRequired: return "ClientCertificateRequired";
        case StatusCode::CertificateNotAuthorised:  return "CertificateNotAuthorised";
        case StatusCode::CertificateNotValid:       return "CertificateNotValid";
    }
    return "Unknown";
}

namespace {
inline int band(StatusCode s) { return status_value(s) / 10; }
} // namespace

bool is_input_required(StatusCode s)    { return band(s) == 1; }
bool is_success(StatusCode s)           { return band(s) == 2; }
bool is_redirect(StatusCode s)          { return band(s) == 3; }
bool is_temporary_failure(StatusCode s) { return band(s) == 4; }
bool is_permanent_failure(StatusCode s) { return band(s) == 5; }
bool is_cert_error(StatusCode s)        { return band(s) == 6; }

} // namespace gw
