#include "local_engine.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

std::expected<std::unique_ptr<SpeechEngine>, Error>
PlaceholderEngine::load(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return std::unexpected(Error{ErrorKind::NotFound, "model file not found: " + path});
    }
    std::println(stderr, "local: initialized model from {}", path);
    return std::make_unique<PlaceholderEngine>(Private{}, path);
}

std::expected<std::string, Error>
PlaceholderEngine::transcribe(std::span<const float> /*samples*/) {
    std::println(stderr, "local: using placeholder transcription, model inference not integrated");
    return std::string(kText);
}

LocalEngineHandle::LocalEngineHandle(EngineFactory factory) : factory_(std::move(factory)) {}

LocalEngineHandle& LocalEngineHandle::shared() {
    static LocalEngineHandle handle(&PlaceholderEngine::load);
    return handle;
}

std::expected<void, Error> LocalEngineHandle::acquire(const std::string& model_path) {
    if (state() == EngineState::Ready) return {};

    std::lock_guard<std::mutex> lock(init_mutex_);
    if (state() == EngineState::Ready) return {};

    auto engine = factory_(model_path);
    if (!engine) return std::unexpected(std::move(engine.error()));
    if (!*engine) {
        return std::unexpected(Error{ErrorKind::Unavailable,
                                     "engine factory returned nothing for " + model_path});
    }

    engine_ = std::move(*engine);
    state_.store(EngineState::Ready, std::memory_order_release);
    return {};
}

std::expected<std::string, Error> LocalEngineHandle::transcribe(std::span<const float> samples) {
    if (state() != EngineState::Ready) {
        return std::unexpected(Error{ErrorKind::Unavailable, "local engine not initialized"});
    }

    if (engine_->concurrent_safe()) {
        return engine_->transcribe(samples);
    }
    std::lock_guard<std::mutex> lock(run_mutex_);
    return engine_->transcribe(samples);
}
