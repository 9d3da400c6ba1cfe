#include "preprocessor.hpp"
#include "wav.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace audio {

std::expected<std::vector<uint8_t>, Error> read_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(Error{ErrorKind::NotFound, "audio file does not exist: " + path});
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Io,
                                     std::format("cannot stat {}: {}", path, ec.message())});
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorKind::Io, "cannot open " + path});
    }

    std::vector<uint8_t> data(size);
    f.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (static_cast<uintmax_t>(f.gcount()) != size) {
        return std::unexpected(Error{ErrorKind::Io,
                                     std::format("short read on {}: {} of {} bytes",
                                                 path, f.gcount(), size)});
    }
    return data;
}

std::vector<float> normalize(std::span<const uint8_t> bytes, uint32_t sample_rate,
                             uint32_t max_seconds) {
    auto pcm = wav::pcm_payload(bytes);

    std::vector<float> out(window_samples(sample_rate, max_seconds), 0.0f);
    size_t n = std::min(pcm.size() / 2, out.size());

    for (size_t i = 0; i < n; ++i) {
        // Little-endian regardless of host order
        auto lo = static_cast<uint16_t>(pcm[2 * i]);
        auto hi = static_cast<uint16_t>(pcm[2 * i + 1]);
        auto sample = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        out[i] = static_cast<float>(sample) / 32768.0f;
    }
    return out;
}

std::expected<void, Error> check_wav_format(std::span<const uint8_t> bytes) {
    if (!wav::is_riff(bytes)) return {};

    auto fmt = wav::format(bytes);
    if (!fmt) {
        return std::unexpected(Error{ErrorKind::Encoding, "WAV file without a fmt chunk"});
    }
    if (fmt->audio_format != 1 || fmt->channels != 1 || fmt->bits_per_sample != 16 ||
        fmt->sample_rate != kSampleRate) {
        return std::unexpected(Error{ErrorKind::Encoding,
            std::format("unsupported WAV format: format {}, {} ch, {} bit, {} Hz "
                        "(need 16-bit mono PCM at {} Hz)",
                        fmt->audio_format, fmt->channels, fmt->bits_per_sample,
                        fmt->sample_rate, kSampleRate)});
    }
    return {};
}

std::expected<std::vector<float>, Error> normalize_file(const std::string& path) {
    auto bytes = read_file(path);
    if (!bytes) return std::unexpected(std::move(bytes.error()));
    if (auto ok = check_wav_format(*bytes); !ok) {
        std::println(stderr, "audio: {}: {}", path, ok.error().message);
        return std::unexpected(std::move(ok.error()));
    }
    return normalize(*bytes);
}

} // namespace audio
