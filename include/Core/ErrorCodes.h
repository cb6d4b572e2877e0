#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and their names.
 */

#include <stddef.h>
#include <stdint.h>

enum class ErrorCode : uint16_t {
    NotFound = 0,
    InvalidTransition,
    WrongDirection,
    PersistenceError,
    TransportError,
    BadPayload,
    UnknownTopic,
    IoError,
    NotReady
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::InvalidTransition: return "InvalidTransition";
    case ErrorCode::WrongDirection: return "WrongDirection";
    case ErrorCode::PersistenceError: return "PersistenceError";
    case ErrorCode::TransportError: return "TransportError";
    case ErrorCode::BadPayload: return "BadPayload";
    case ErrorCode::UnknownTopic: return "UnknownTopic";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::NotReady: return "NotReady";
    default: return "Unknown";
    }
}

/** @brief Store `code` into an optional out-parameter and return false. */
static inline bool failWith(ErrorCode* out, ErrorCode code)
{
    if (out) *out = code;
    return false;
}
