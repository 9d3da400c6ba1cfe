#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>

// Read-only RIFF/WAVE chunk access.
namespace wav {

struct Format {
    uint16_t audio_format = 0;  // 1 = integer PCM
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
};

inline bool is_riff(std::span<const uint8_t> bytes) {
    return bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
           std::memcmp(bytes.data() + 8, "WAVE", 4) == 0;
}

// Body of the first chunk tagged `id`, clamped to the available bytes.
inline std::optional<std::span<const uint8_t>> find_chunk(std::span<const uint8_t> bytes,
                                                          std::string_view id) {
    if (!is_riff(bytes)) return std::nullopt;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size;
        std::memcpy(&chunk_size, bytes.data() + pos + 4, 4);
        size_t body = pos + 8;
        if (std::memcmp(bytes.data() + pos, id.data(), 4) == 0) {
            size_t len = std::min<size_t>(chunk_size, bytes.size() - body);
            return bytes.subspan(body, len);
        }
        // Chunks are word aligned.
        pos = body + chunk_size + (chunk_size & 1);
    }
    return std::nullopt;
}

inline std::optional<Format> format(std::span<const uint8_t> bytes) {
    auto fmt = find_chunk(bytes, "fmt ");
    if (!fmt || fmt->size() < 16) return std::nullopt;

    Format f;
    std::memcpy(&f.audio_format, fmt->data(), 2);
    std::memcpy(&f.channels, fmt->data() + 2, 2);
    std::memcpy(&f.sample_rate, fmt->data() + 4, 4);
    std::memcpy(&f.bits_per_sample, fmt->data() + 14, 2);
    return f;
}

// Payload of the "data" chunk for a RIFF/WAVE file, otherwise `bytes`
// unchanged (treated as headerless PCM). A RIFF file without a data chunk
// carries no samples.
inline std::span<const uint8_t> pcm_payload(std::span<const uint8_t> bytes) {
    if (!is_riff(bytes)) return bytes;
    return find_chunk(bytes, "data").value_or(std::span<const uint8_t>{});
}

} // namespace wav
