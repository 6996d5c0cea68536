//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error kinds, the MonzoError exception and HTTP status mapping helpers.
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace monzo {
namespace errors {

// Categorization of every failure the library reports.
enum class ErrorKind {
    // Authentication handshake
    AuthAborted,
    StateMismatch,
    InvalidCallback,
    TokenExchangeFailed,
    InternalProtocolViolation,
    // HTTP status mapping
    BadRequest,
    Unauthorized,
    Forbidden,
    NotFound,
    MethodNotAllowed,
    NotAcceptable,
    TooManyRequests,
    InternalServerError,
    GatewayTimeout,
    Api,
    // Local failures
    Decode,
    Transport,
    InvalidArgument
};

//==========================================================================================================
// MonzoError
// Purpose: Exception thrown by every monzo-cpp operation.
// Fields:
//   kind: Error category.
//   httpStatus: HTTP status code when the error came from an HTTP response, 0 otherwise.
//   cause: Underlying kind when the error wraps another failure (e.g. TokenExchangeFailed caused by
//          Unauthorized).
//==========================================================================================================
class MonzoError : public std::runtime_error {
public:
    MonzoError(ErrorKind kind, const std::string& message, int httpStatus = 0,
               std::optional<ErrorKind> cause = std::nullopt)
        : std::runtime_error(message), errorKind(kind), status(httpStatus), causeKind(cause) {}

    ErrorKind kind() const noexcept { return errorKind; }
    int httpStatus() const noexcept { return status; }
    std::optional<ErrorKind> cause() const noexcept { return causeKind; }

private:
    ErrorKind errorKind;
    int status;
    std::optional<ErrorKind> causeKind;
};

// Map an HTTP status code to an ErrorKind.
//
// Args:
//   status: HTTP status code of a non-2xx response.
//
// Returns:
//   The named kind for 400/401/403/404/405/406/429/500/504, Api for anything else.
inline ErrorKind errorKindFromStatus(int status) {
    switch (status) {
        case 400: return ErrorKind::BadRequest;
        case 401: return ErrorKind::Unauthorized;
        case 403: return ErrorKind::Forbidden;
        case 404: return ErrorKind::NotFound;
        case 405: return ErrorKind::MethodNotAllowed;
        case 406: return ErrorKind::NotAcceptable;
        case 429: return ErrorKind::TooManyRequests;
        case 500: return ErrorKind::InternalServerError;
        case 504: return ErrorKind::GatewayTimeout;
        default: return ErrorKind::Api;
    }
}

// Stable name of an ErrorKind for diagnostics.
inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AuthAborted: return "AuthAborted";
        case ErrorKind::StateMismatch: return "StateMismatch";
        case ErrorKind::InvalidCallback: return "InvalidCallback";
        case ErrorKind::TokenExchangeFailed: return "TokenExchangeFailed";
        case ErrorKind::InternalProtocolViolation: return "InternalProtocolViolation";
        case ErrorKind::BadRequest: return "BadRequest";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::Forbidden: return "Forbidden";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::MethodNotAllowed: return "MethodNotAllowed";
        case ErrorKind::NotAcceptable: return "NotAcceptable";
        case ErrorKind::TooManyRequests: return "TooManyRequests";
        case ErrorKind::InternalServerError: return "InternalServerError";
        case ErrorKind::GatewayTimeout: return "GatewayTimeout";
        case ErrorKind::Api: return "Api";
        case ErrorKind::Decode: return "Decode";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

// True for 2xx statuses.
inline bool isSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

// Build the error raised for a non-2xx API response.
//
// Args:
//   status: HTTP status code.
//   body: Response body, echoed into the message for diagnostics.
//
// Returns:
//   MonzoError with the mapped kind and status.
inline MonzoError makeHttpError(int status, const std::string& body) {
    return MonzoError(errorKindFromStatus(status),
                      std::string("Error fetching request: (") + std::to_string(status) + std::string("): ") + body,
                      status);
}

} // namespace errors
} // namespace monzo
