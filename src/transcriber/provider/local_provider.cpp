#include "local_provider.hpp"

#include "../audio/preprocessor.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::string resolve_model_path(const ProviderConfig& config, const std::string& models_dir) {
    if (!config.local.model_path.empty()) return config.local.model_path;
    if (models_dir.empty()) return {};

    auto candidate = fs::path(models_dir) / LocalProvider::kModelFilename;
    std::error_code ec;
    if (fs::exists(candidate, ec)) return candidate.string();
    return {};
}

LocalProvider::LocalProvider(LocalEngineHandle& engine, std::string models_dir)
    : engine_(engine), models_dir_(std::move(models_dir)) {}

std::expected<void, Error> LocalProvider::check_available(const ProviderConfig& config) const {
    if (!config.local.enabled) {
        return std::unexpected(Error{ErrorKind::Unavailable, "local transcription disabled"});
    }
    if (!config.local.model_downloaded) {
        return std::unexpected(Error{ErrorKind::Unavailable, "model not downloaded"});
    }

    auto path = resolve_model_path(config, models_dir_);
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return std::unexpected(Error{ErrorKind::Unavailable, "model file not found"});
    }
    return {};
}

std::expected<std::string, Error>
LocalProvider::transcribe(const TranscriptionRequest& request, const ProviderConfig& config) {
    if (auto ready = engine_.acquire(resolve_model_path(config, models_dir_)); !ready) {
        return std::unexpected(std::move(ready.error()));
    }

    auto samples = audio::normalize_file(request.file_path);
    if (!samples) return std::unexpected(std::move(samples.error()));

    return engine_.transcribe(*samples);
}
