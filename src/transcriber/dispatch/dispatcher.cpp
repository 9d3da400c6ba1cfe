#include "dispatcher.hpp"

#include <exception>
#include <format>
#include <memory>
#include <print>

ProviderDispatcher::ProviderDispatcher(TranscriptionProvider& cloud,
                                       TranscriptionProvider& local,
                                       unsigned workers, size_t queue_capacity, bool verbose)
    : cloud_(cloud), local_(local), verbose_(verbose), queue_(workers, queue_capacity) {}

TranscriptionProvider& ProviderDispatcher::select(const ProviderConfig& config) const {
    return config.provider == ProviderKind::Local ? local_ : cloud_;
}

std::expected<void, Error> ProviderDispatcher::check(const TranscriptionRequest& request,
                                                     const ProviderConfig& config) const {
    if (auto available = select(config).check_available(config); !available) {
        return available;
    }
    if (request.file_path.empty()) {
        return std::unexpected(Error{ErrorKind::Unavailable, "request has no audio file"});
    }
    return {};
}

void ProviderDispatcher::prompt(TranscriptionRequest request, const ProviderConfig& config,
                                OutcomeCallback callback) {
    auto& provider = select(config);

    if (auto ok = check(request, config); !ok) {
        log(std::format("{}: rejected {}: {}", provider.name(),
                        request.file_path, ok.error().message));
        callback(TranscriptionFailed{std::move(ok.error())});
        return;
    }

    // The config is snapshotted so later edits don't affect this request.
    // The callback is shared so it is still reachable if the queue refuses the job.
    auto cb = std::make_shared<OutcomeCallback>(std::move(callback));

    bool accepted = queue_.try_post([this, &provider, cb, request, config]() {
        log(std::format("{}: transcribing {}", provider.name(), request.file_path));

        Outcome outcome;
        try {
            outcome = to_outcome(provider.transcribe(request, config));
        } catch (const std::exception& e) {
            std::println(stderr, "{}: error during transcription: {}", provider.name(), e.what());
            outcome = TranscriptionFailed{Error{ErrorKind::Io, e.what()}};
        } catch (...) {
            std::println(stderr, "{}: unknown error during transcription", provider.name());
            outcome = TranscriptionFailed{Error{ErrorKind::Io, "unknown error"}};
        }

        log(std::format("{}: {} -> {}", provider.name(), request.file_path, describe(outcome)));
        (*cb)(std::move(outcome));
    });

    if (!accepted) {
        log(std::format("{}: queue full ({} pending), rejecting {}", provider.name(),
                        queue_.capacity(), request.file_path));
        (*cb)(TranscriptionFailed{Error{ErrorKind::Busy, "too many transcriptions in flight"}});
    }
}

std::future<Outcome> ProviderDispatcher::prompt(TranscriptionRequest request,
                                                const ProviderConfig& config) {
    auto promise = std::make_shared<std::promise<Outcome>>();
    auto future = promise->get_future();
    prompt(std::move(request), config, [promise](Outcome outcome) {
        promise->set_value(std::move(outcome));
    });
    return future;
}

void ProviderDispatcher::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxscribe] {}", msg);
    }
}
