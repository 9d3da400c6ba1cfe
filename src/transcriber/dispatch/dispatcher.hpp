#pragma once

#include "../config.hpp"
#include "../outcome.hpp"
#include "../provider/provider.hpp"
#include "../request.hpp"
#include "task_queue.hpp"

#include <future>

// Single entry point for transcription. Picks the provider named by the
// config, rejects unavailable providers on the calling thread, and runs the
// job on the TaskQueue. Every request gets exactly one outcome.
class ProviderDispatcher {
public:
    // Providers must outlive the dispatcher. Destruction waits for queued jobs.
    ProviderDispatcher(TranscriptionProvider& cloud, TranscriptionProvider& local,
                       unsigned workers, size_t queue_capacity, bool verbose = false);

    ProviderDispatcher(const ProviderDispatcher&) = delete;
    ProviderDispatcher& operator=(const ProviderDispatcher&) = delete;

    // The callback runs on a worker thread, or on the caller's thread when
    // the request is rejected up front (empty path, provider unavailable,
    // queue full).
    void prompt(TranscriptionRequest request, const ProviderConfig& config,
                OutcomeCallback callback);

    std::future<Outcome> prompt(TranscriptionRequest request, const ProviderConfig& config);

    // Reason the request would be rejected before any I/O, if any.
    std::expected<void, Error> check(const TranscriptionRequest& request,
                                     const ProviderConfig& config) const;

private:
    TranscriptionProvider& select(const ProviderConfig& config) const;

    void log(const std::string& msg);

    TranscriptionProvider& cloud_;
    TranscriptionProvider& local_;
    bool verbose_;
    // Last member: joined before anything the jobs touch goes away.
    TaskQueue queue_;
};
