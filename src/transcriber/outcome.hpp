#pragma once

#include "error.hpp"

#include <expected>
#include <functional>
#include <string>
#include <variant>

struct Transcribed {
    std::string text;
};

struct EmptyTranscript {};

struct TranscriptionFailed {
    Error error;
};

struct RateLimited {
    std::string detail;
};

// Exactly one of these is delivered per request.
using Outcome = std::variant<Transcribed, EmptyTranscript, TranscriptionFailed, RateLimited>;
using OutcomeCallback = std::function<void(Outcome)>;

// Result observer registered by UI code.
class OutcomeObserver {
public:
    virtual ~OutcomeObserver() = default;
    virtual void on_success(const std::string& text) = 0;
    virtual void on_empty() = 0;
    virtual void on_failed(const Error& error) = 0;
    virtual void on_too_many_requests() = 0;
};

void notify(OutcomeObserver& observer, const Outcome& outcome);

// Maps a provider result onto the four terminal outcomes.
Outcome to_outcome(std::expected<std::string, Error> result);

std::string describe(const Outcome& outcome);

std::string trim(const std::string& s);
