#pragma once

#include "../engine/local_engine.hpp"
#include "provider.hpp"

#include <string>

class LocalProvider : public TranscriptionProvider {
public:
    static constexpr const char* kModelFilename = "whisper_base.tflite";

    // models_dir is where a downloaded model lands when no path is configured.
    LocalProvider(LocalEngineHandle& engine, std::string models_dir);

    std::string_view name() const override { return "local"; }
    std::expected<void, Error> check_available(const ProviderConfig& config) const override;
    std::expected<std::string, Error>
        transcribe(const TranscriptionRequest& request, const ProviderConfig& config) override;

private:
    LocalEngineHandle& engine_;
    std::string models_dir_;
};

// Configured path if set, else <models_dir>/whisper_base.tflite when it
// exists on disk; empty when nothing can be found.
std::string resolve_model_path(const ProviderConfig& config, const std::string& models_dir);
