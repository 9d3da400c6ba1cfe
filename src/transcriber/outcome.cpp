#include "outcome.hpp"

#include <format>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

void notify(OutcomeObserver& observer, const Outcome& outcome) {
    std::visit(overloaded{
        [&](const Transcribed& t) { observer.on_success(t.text); },
        [&](const EmptyTranscript&) { observer.on_empty(); },
        [&](const TranscriptionFailed& f) { observer.on_failed(f.error); },
        [&](const RateLimited&) { observer.on_too_many_requests(); },
    }, outcome);
}

Outcome to_outcome(std::expected<std::string, Error> result) {
    if (!result) {
        if (result.error().kind == ErrorKind::RateLimited) {
            return RateLimited{std::move(result.error().message)};
        }
        return TranscriptionFailed{std::move(result.error())};
    }

    auto text = trim(*result);
    if (text.empty()) return EmptyTranscript{};
    return Transcribed{std::move(text)};
}

std::string describe(const Outcome& outcome) {
    return std::visit(overloaded{
        [](const Transcribed& t) { return t.text; },
        [](const EmptyTranscript&) { return std::string("(empty transcription)"); },
        [](const TranscriptionFailed& f) {
            return std::format("failed: {}: {}", to_string(f.error.kind), f.error.message);
        },
        [](const RateLimited& r) {
            return r.detail.empty() ? std::string("rate limited, retry later")
                                    : "rate limited: " + r.detail;
        },
    }, outcome);
}

std::string trim(const std::string& s) {
    auto start_pos = s.find_first_not_of(" \t\n\r\f\v");
    if (start_pos == std::string::npos) return {};
    auto end_pos = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start_pos, end_pos - start_pos + 1);
}
