//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed gateway error kinds, the GatewayError exception and JSON mapping helpers
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "apigw/JSONValue.h"

namespace apigw {
namespace errors {

// Structured error kinds surfaced by registration and call paths.
enum class ErrorKind {
    MalformedReference,
    UnsupportedReference,
    InvalidSpecification,
    UnsupportedFamily,
    UnsupportedProtocol,
    MissingRequiredParameter,
    TypeMismatch,
    EndpointNotFound,
    AuthenticationFailed,
    InvalidState,
    ExpiredState,
    AuthorizationExpired,
    TransportTimeout,
    TransportConnection,
    InvalidConfiguration,
    Internal
};

// Transport failure reasons carried in GatewayError::detail() for TransportConnection errors.
namespace reasons {
inline constexpr const char* ConnectionRefused = "connection_refused";
inline constexpr const char* DnsFailure = "dns_failure";
inline constexpr const char* Tls = "tls";
inline constexpr const char* Io = "io";
inline constexpr const char* NoClient = "no_client";
inline constexpr const char* Timeout = "timeout";
} // namespace reasons

// Stable snake_case name of an ErrorKind (e.g. "missing_required_parameter").
inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedReference: return "malformed_reference";
        case ErrorKind::UnsupportedReference: return "unsupported_reference";
        case ErrorKind::InvalidSpecification: return "invalid_specification";
        case ErrorKind::UnsupportedFamily: return "unsupported_family";
        case ErrorKind::UnsupportedProtocol: return "unsupported_protocol";
        case ErrorKind::MissingRequiredParameter: return "missing_required_parameter";
        case ErrorKind::TypeMismatch: return "type_mismatch";
        case ErrorKind::EndpointNotFound: return "endpoint_not_found";
        case ErrorKind::AuthenticationFailed: return "authentication_failed";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::ExpiredState: return "expired_state";
        case ErrorKind::AuthorizationExpired: return "authorization_expired";
        case ErrorKind::TransportTimeout: return "transport_timeout";
        case ErrorKind::TransportConnection: return "transport_connection";
        case ErrorKind::InvalidConfiguration: return "invalid_configuration";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

//==========================================================================================================
// GatewayError
// Purpose: Exception carrying a structured ErrorKind plus the offending field and a detail string.
// Fields:
//   kind: Error category.
//   field: Parameter name, JSON path, reference or identifier the error is about (may be empty).
//   detail: Expected type (TypeMismatch), transport reason (TransportConnection/Timeout) or aggregated
//           per-scheme reasons (AuthenticationFailed). May be empty.
//==========================================================================================================
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message, std::string field = std::string(), std::string detail = std::string())
        : std::runtime_error(message), errKind(kind), errField(std::move(field)), errDetail(std::move(detail)) {}

    ErrorKind kind() const noexcept { return errKind; }
    const std::string& field() const noexcept { return errField; }
    const std::string& detail() const noexcept { return errDetail; }

private:
    ErrorKind errKind;
    std::string errField;
    std::string errDetail;
};

// Convenience constructors for the kinds raised from several modules.
inline GatewayError missingRequiredParameter(const std::string& name) {
    return GatewayError(ErrorKind::MissingRequiredParameter, "Missing required parameter: " + name, name);
}

inline GatewayError typeMismatch(const std::string& name, const std::string& expected) {
    return GatewayError(ErrorKind::TypeMismatch, "Parameter " + name + " must be of type " + expected, name, expected);
}

inline GatewayError invalidSpecification(const std::string& field, const std::string& why) {
    return GatewayError(ErrorKind::InvalidSpecification, "Invalid specification: " + why, field);
}

inline GatewayError transportConnection(const std::string& message, const std::string& reason) {
    return GatewayError(ErrorKind::TransportConnection, message, std::string(), reason);
}

inline GatewayError transportTimeout(const std::string& message) {
    return GatewayError(ErrorKind::TransportTimeout, message, std::string(), reasons::Timeout);
}

// Create a JSONValue error object { kind, message, field?, detail? } for front-ends.
//
// Args:
//   err: The GatewayError to serialize.
//
// Returns:
//   JSONValue of Object type.
inline JSONValue makeErrorValue(const GatewayError& err) {
    JSONValue obj = JSONValue::object();
    obj.set("kind", JSONValue(toString(err.kind())));
    obj.set("message", JSONValue(std::string(err.what())));
    if (!err.field().empty()) {
        obj.set("field", JSONValue(err.field()));
    }
    if (!err.detail().empty()) {
        obj.set("detail", JSONValue(err.detail()));
    }
    return obj;
}

} // namespace errors
} // namespace apigw
