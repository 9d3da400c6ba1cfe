#pragma once

#include "../config.hpp"
#include "../error.hpp"
#include "../request.hpp"

#include <expected>
#include <string>
#include <string_view>

class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    virtual std::string_view name() const = 0;

    // Decided from the config alone (plus a model-file existence check for
    // the local provider). Runs before any audio is read.
    virtual std::expected<void, Error> check_available(const ProviderConfig& config) const = 0;

    // Raw transcription text, untrimmed. Blocking.
    virtual std::expected<std::string, Error>
        transcribe(const TranscriptionRequest& request, const ProviderConfig& config) = 0;
};
