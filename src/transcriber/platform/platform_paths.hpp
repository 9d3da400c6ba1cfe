#pragma once

#include <string>

namespace platform {

// Empty when no home directory can be determined.
std::string config_dir();
std::string data_dir();

// Directory holding downloaded on-device models.
std::string models_dir();

} // namespace platform
