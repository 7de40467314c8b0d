#pragma once
#include <optional>
#include <string>
#include <utility>

namespace blelink
{

enum class ErrorCode
{
    Transport,              // reported by the radio transport, message passed through
    InvalidService,         // discovery succeeded but the service is still missing
    InvalidCharacteristic,  // discovery succeeded but the characteristic is still missing
    Timeout,                // capture or connection timer fired first
    NotConnected            // transport refused the call (no link / no object)
};

struct Error
{
    ErrorCode   code = ErrorCode::Transport;
    std::string message;

    static Error transport(std::string msg) { return Error{ErrorCode::Transport, std::move(msg)}; }
    static Error timeout() { return Error{ErrorCode::Timeout, "timed out"}; }
};

// Empty optional means success.
using MaybeError = std::optional<Error>;

inline const char *error_code_name(ErrorCode c)
{
    switch (c)
    {
        case ErrorCode::Transport:
            return "transport";
        case ErrorCode::InvalidService:
            return "invalid-service";
        case ErrorCode::InvalidCharacteristic:
            return "invalid-characteristic";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::NotConnected:
            return "not-connected";
    }
    return "?";
}

inline std::string describe(const MaybeError &e)
{
    if (!e)
        return "ok";
    std::string s = error_code_name(e->code);
    if (!e->message.empty())
        s += ": " + e->message;
    return s;
}

}  // namespace blelink
