#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Out-of-range values keep the default; nlohmann would wrap negatives into
// huge unsigned numbers if read as unsigned directly.
template <class T>
void read_bounded(const json& obj, const char* section, const char* key,
                  long long min, long long max, T& out) {
    if (!obj.contains(key)) return;
    auto v = obj[key].get<long long>();
    if (v < min || v > max) {
        std::println(stderr, "config: {}.{} = {} out of range [{}, {}], using {}",
                     section, key, v, min, max, out);
        return;
    }
    out = static_cast<T>(v);
}

} // namespace

bool parse_provider_kind(const std::string& s, ProviderKind& out) {
    if (s == "cloud") {
        out = ProviderKind::Cloud;
        return true;
    }
    if (s == "local") {
        out = ProviderKind::Local;
        return true;
    }
    return false;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("provider")) {
            auto name = j["provider"].get<std::string>();
            if (!parse_provider_kind(name, cfg.providers.provider)) {
                std::println(stderr, "config: unknown provider '{}', using cloud", name);
            }
        }

        if (j.contains("cloud")) {
            auto& c = j["cloud"];
            auto& out = cfg.providers.cloud;
            if (c.contains("enabled")) out.enabled = c["enabled"].get<bool>();
            if (c.contains("api_key")) out.api_key = c["api_key"].get<std::string>();
            if (c.contains("model")) out.model = c["model"].get<std::string>();
            if (c.contains("endpoint")) out.endpoint = c["endpoint"].get<std::string>();
        }

        if (j.contains("local")) {
            auto& l = j["local"];
            auto& out = cfg.providers.local;
            if (l.contains("enabled")) out.enabled = l["enabled"].get<bool>();
            if (l.contains("model_path")) out.model_path = l["model_path"].get<std::string>();
            if (l.contains("model_downloaded")) out.model_downloaded = l["model_downloaded"].get<bool>();
        }

        if (j.contains("dispatch")) {
            auto& d = j["dispatch"];
            read_bounded(d, "dispatch", "workers", 1, kMaxWorkers, cfg.dispatch.workers);
            read_bounded(d, "dispatch", "queue_capacity", 1, kMaxQueueCapacity,
                         cfg.dispatch.queue_capacity);
        }

        if (j.contains("http")) {
            auto& h = j["http"];
            read_bounded(h, "http", "connect_timeout_s", 1, kMaxTimeoutSeconds,
                         cfg.http.connect_timeout_s);
            read_bounded(h, "http", "read_timeout_s", 1, kMaxTimeoutSeconds,
                         cfg.http.read_timeout_s);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
