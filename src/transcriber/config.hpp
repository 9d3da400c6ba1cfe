#pragma once

#include <cstddef>
#include <string>

enum class ProviderKind { Cloud, Local };

// Read by the dispatcher on every call; never cached.
struct ProviderConfig {
    ProviderKind provider = ProviderKind::Cloud;

    struct Cloud {
        bool enabled = false;
        std::string api_key;
        std::string model = "whisper-1";
        std::string endpoint = "https://api.openai.com/v1/audio/transcriptions";
    } cloud;

    struct Local {
        bool enabled = false;
        std::string model_path;     // empty: look in platform::models_dir()
        bool model_downloaded = false;
    } local;
};

struct Config {
    static constexpr long long kMaxWorkers = 64;
    static constexpr long long kMaxQueueCapacity = 4096;
    static constexpr long long kMaxTimeoutSeconds = 600;

    ProviderConfig providers;

    struct Dispatch {
        unsigned workers = 2;
        size_t queue_capacity = 16;
    } dispatch;

    struct Http {
        long connect_timeout_s = 30;
        long read_timeout_s = 30;
    } http;

    static Config load(const std::string& path);
    static Config load_default();
};

// "cloud" / "local"; false for anything else.
bool parse_provider_kind(const std::string& s, ProviderKind& out);
