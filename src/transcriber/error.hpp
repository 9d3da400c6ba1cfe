#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Unavailable, // provider disabled, missing credentials or model
    NotFound,
    Io,
    Transport,
    RateLimited,
    Parse,
    Encoding,
    Busy,        // dispatch queue full
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::RateLimited: return "rate limited";
        case ErrorKind::Parse: return "parse error";
        case ErrorKind::Encoding: return "encoding error";
        case ErrorKind::Busy: return "busy";
    }
    return "unknown";
}
