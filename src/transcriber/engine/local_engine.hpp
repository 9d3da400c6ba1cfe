#pragma once

#include "../error.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

// On-device speech-to-text model.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<std::string, Error> transcribe(std::span<const float> samples) = 0;
    virtual const std::string& model_path() const = 0;
    // Whether transcribe() may run on several threads at once.
    virtual bool concurrent_safe() const { return false; }
};

// Stands in for the real model until inference is integrated: loads nothing
// but requires the model file to exist, and always answers with kText.
class PlaceholderEngine : public SpeechEngine {
    struct Private {
        explicit Private() = default;
    };

public:
    static constexpr std::string_view kText =
        "Transcription pending - on-device model integration needed";

    static std::expected<std::unique_ptr<SpeechEngine>, Error> load(const std::string& path);

    // Only reachable through load().
    PlaceholderEngine(Private, std::string path) : model_path_(std::move(path)) {}

    std::expected<std::string, Error> transcribe(std::span<const float> samples) override;
    const std::string& model_path() const override { return model_path_; }

private:
    std::string model_path_;
};

enum class EngineState { NotReady, Ready };

// Holds the single engine instance. The first successful acquire() constructs
// it; concurrent first callers wait on the same lock and see the result.
// A failed construction leaves the handle NotReady.
class LocalEngineHandle {
public:
    using EngineFactory =
        std::function<std::expected<std::unique_ptr<SpeechEngine>, Error>(const std::string&)>;

    explicit LocalEngineHandle(EngineFactory factory);

    LocalEngineHandle(const LocalEngineHandle&) = delete;
    LocalEngineHandle& operator=(const LocalEngineHandle&) = delete;

    // Process-wide handle backed by PlaceholderEngine. Never torn down.
    static LocalEngineHandle& shared();

    std::expected<void, Error> acquire(const std::string& model_path);

    EngineState state() const { return state_.load(std::memory_order_acquire); }

    // Unavailable while NotReady. Serialized unless the engine is concurrent_safe().
    std::expected<std::string, Error> transcribe(std::span<const float> samples);

private:
    EngineFactory factory_;
    std::atomic<EngineState> state_{EngineState::NotReady};
    std::mutex init_mutex_;
    std::mutex run_mutex_;
    std::unique_ptr<SpeechEngine> engine_;
};
