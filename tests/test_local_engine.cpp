#include <catch2/catch_test_macros.hpp>

#include "engine/local_engine.hpp"
#include "provider/local_provider.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <latch>
#include <thread>
#include <vector>

using testing::TmpDir;

namespace {

class CountingEngine : public SpeechEngine {
public:
    explicit CountingEngine(std::string path) : path_(std::move(path)) {}

    std::expected<std::string, Error> transcribe(std::span<const float> samples) override {
        int now = ++active_;
        int seen = max_active_.load();
        while (now > seen && !max_active_.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active_;
        return samples.empty() ? std::string() : std::string(" heard ");
    }
    const std::string& model_path() const override { return path_; }

    static inline std::atomic<int> active_{0};
    static inline std::atomic<int> max_active_{0};

private:
    std::string path_;
};

} // namespace

TEST_CASE("PlaceholderEngine", "[local]") {
    TmpDir dir;

    SECTION("LoadsFromExistingPath") {
        auto path = dir.write("whisper_base.tflite", std::string("weights"));
        auto engine = PlaceholderEngine::load(path);
        REQUIRE(engine.has_value());
        REQUIRE((*engine)->model_path() == path);

        std::vector<float> samples(16, 0.0f);
        auto text = (*engine)->transcribe(samples);
        REQUIRE(text.has_value());
        REQUIRE(*text == PlaceholderEngine::kText);
    }

    SECTION("MissingModelIsNotFound") {
        auto engine = PlaceholderEngine::load((dir.path / "nope.tflite").string());
        REQUIRE_FALSE(engine.has_value());
        REQUIRE(engine.error().kind == ErrorKind::NotFound);
    }

    SECTION("DirectoryIsNotAModel") {
        REQUIRE_FALSE(PlaceholderEngine::load(dir.path.string()).has_value());
    }
}

TEST_CASE("LocalEngineHandle", "[local]") {
    std::atomic<int> constructions{0};
    LocalEngineHandle handle([&](const std::string& path)
                                 -> std::expected<std::unique_ptr<SpeechEngine>, Error> {
        ++constructions;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::make_unique<CountingEngine>(path);
    });

    SECTION("NotReadyBeforeAcquire") {
        REQUIRE(handle.state() == EngineState::NotReady);
        std::vector<float> samples(4);
        auto r = handle.transcribe(samples);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Unavailable);
        REQUIRE(constructions == 0);
    }

    SECTION("ConcurrentFirstAcquireConstructsOnce") {
        constexpr int n = 16;
        std::latch start(n);
        std::atomic<int> ok{0};
        std::vector<std::jthread> threads;
        for (int i = 0; i < n; ++i) {
            threads.emplace_back([&] {
                start.arrive_and_wait();
                if (handle.acquire("/models/base.tflite")) ++ok;
            });
        }
        threads.clear();

        REQUIRE(constructions == 1);
        REQUIRE(ok == n);
        REQUIRE(handle.state() == EngineState::Ready);
    }

    SECTION("LaterAcquireKeepsFirstEngine") {
        REQUIRE(handle.acquire("/models/a.tflite").has_value());
        REQUIRE(handle.acquire("/models/b.tflite").has_value());
        REQUIRE(constructions == 1);
    }

    SECTION("TranscribeIsSerialized") {
        REQUIRE(handle.acquire("/models/base.tflite").has_value());
        CountingEngine::max_active_ = 0;

        std::vector<float> samples(8, 0.1f);
        std::atomic<int> ok{0};
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (handle.transcribe(samples)) ++ok;
            });
        }
        threads.clear();
        REQUIRE(ok == 8);
        REQUIRE(CountingEngine::max_active_ == 1);
    }
}

TEST_CASE("LocalEngineHandle failed construction", "[local]") {
    int attempts = 0;
    LocalEngineHandle handle([&](const std::string& path)
                                 -> std::expected<std::unique_ptr<SpeechEngine>, Error> {
        if (++attempts == 1) {
            return std::unexpected(Error{ErrorKind::NotFound, "model file not found: " + path});
        }
        return std::make_unique<CountingEngine>(path);
    });

    auto first = handle.acquire("/models/base.tflite");
    REQUIRE_FALSE(first.has_value());
    REQUIRE(first.error().kind == ErrorKind::NotFound);
    REQUIRE(handle.state() == EngineState::NotReady);

    // Model appeared later: a retry succeeds.
    REQUIRE(handle.acquire("/models/base.tflite").has_value());
    REQUIRE(handle.state() == EngineState::Ready);
    REQUIRE(attempts == 2);
}

TEST_CASE("resolve_model_path", "[local]") {
    TmpDir dir;
    ProviderConfig cfg;

    SECTION("ConfiguredPathWins") {
        dir.write(LocalProvider::kModelFilename, std::string("w"));
        cfg.local.model_path = "/custom/model.tflite";
        REQUIRE(resolve_model_path(cfg, dir.path.string()) == "/custom/model.tflite");
    }

    SECTION("FallsBackToModelsDir") {
        auto expected = dir.write(LocalProvider::kModelFilename, std::string("w"));
        REQUIRE(resolve_model_path(cfg, dir.path.string()) == expected);
    }

    SECTION("NothingOnDisk") {
        REQUIRE(resolve_model_path(cfg, dir.path.string()).empty());
        REQUIRE(resolve_model_path(cfg, "").empty());
    }
}

TEST_CASE("LocalProvider", "[local]") {
    TmpDir dir;
    auto model = dir.write(LocalProvider::kModelFilename, std::string("weights"));
    auto clip = dir.write("clip.pcm", testing::pcm_bytes({100, -100, 200}));

    std::atomic<int> constructions{0};
    LocalEngineHandle handle([&](const std::string& path)
                                 -> std::expected<std::unique_ptr<SpeechEngine>, Error> {
        ++constructions;
        return std::make_unique<CountingEngine>(path);
    });
    LocalProvider provider(handle, dir.path.string());

    ProviderConfig cfg;
    cfg.provider = ProviderKind::Local;
    cfg.local.enabled = true;
    cfg.local.model_downloaded = true;

    SECTION("Available") {
        REQUIRE(provider.check_available(cfg).has_value());
        // Checking never builds the engine.
        REQUIRE(constructions == 0);
    }

    SECTION("Disabled") {
        cfg.local.enabled = false;
        REQUIRE(provider.check_available(cfg).error().kind == ErrorKind::Unavailable);
    }

    SECTION("NotDownloaded") {
        cfg.local.model_downloaded = false;
        REQUIRE(provider.check_available(cfg).error().kind == ErrorKind::Unavailable);
    }

    SECTION("ConfiguredModelMissing") {
        cfg.local.model_path = (dir.path / "other.tflite").string();
        REQUIRE(provider.check_available(cfg).error().kind == ErrorKind::Unavailable);
    }

    SECTION("Transcribes") {
        auto r = provider.transcribe({.file_path = clip}, cfg);
        REQUIRE(r.has_value());
        REQUIRE(*r == " heard ");
        REQUIRE(constructions == 1);
        REQUIRE(handle.state() == EngineState::Ready);
    }

    SECTION("MissingAudio") {
        auto r = provider.transcribe({.file_path = (dir.path / "gone.pcm").string()}, cfg);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::NotFound);
    }
}
