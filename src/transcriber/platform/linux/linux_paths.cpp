#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// $<env>/voxscribe, or $HOME/<fallback>/voxscribe when <env> is unset or
// empty. Empty when neither is usable.
std::string xdg_dir(const char* env, const char* fallback) {
    std::string base;
    if (const char* v = std::getenv(env); v && *v) {
        base = v;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::string(home) + "/" + fallback;
    } else {
        return {};
    }
    return base + "/voxscribe";
}

} // namespace

std::string config_dir() { return xdg_dir("XDG_CONFIG_HOME", ".config"); }

std::string data_dir() { return xdg_dir("XDG_DATA_HOME", ".local/share"); }

std::string models_dir() {
    auto data = data_dir();
    return data.empty() ? data : data + "/whisper_models";
}

} // namespace platform
