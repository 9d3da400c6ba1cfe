#pragma once

#include <string>

struct TranscriptionRequest {
    std::string file_path;
    std::string mime_type;      // empty: inferred from the file extension
    std::string prompt_hint;
    std::string system_context;
};
