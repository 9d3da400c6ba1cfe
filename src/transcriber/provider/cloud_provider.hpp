#pragma once

#include "../net/http_transport.hpp"
#include "provider.hpp"

// OpenAI-compatible /v1/audio/transcriptions upload.
class CloudProvider : public TranscriptionProvider {
public:
    explicit CloudProvider(HttpTransport& transport);

    std::string_view name() const override { return "cloud"; }
    std::expected<void, Error> check_available(const ProviderConfig& config) const override;
    std::expected<std::string, Error>
        transcribe(const TranscriptionRequest& request, const ProviderConfig& config) override;

private:
    HttpTransport& transport_;
};

// Explicit type wins; otherwise by extension, defaulting to audio/ogg.
std::string infer_mime_type(const std::string& file_name, const std::string& explicit_type = {});

// API key with every space removed and surrounding whitespace trimmed.
std::string normalize_api_key(const std::string& key);
