#pragma once

#include "../error.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace audio {

constexpr uint32_t kSampleRate = 16000;
constexpr uint32_t kMaxSeconds = 30;

constexpr size_t window_samples(uint32_t sample_rate = kSampleRate,
                                uint32_t max_seconds = kMaxSeconds) {
    return static_cast<size_t>(sample_rate) * max_seconds;
}

// Reads a whole file. NotFound if it does not exist, Io on short reads.
std::expected<std::vector<uint8_t>, Error> read_file(const std::string& path);

// Interprets `bytes` as little-endian int16 PCM (a RIFF/WAVE header, if
// present, is skipped) and returns exactly window_samples() floats in
// [-1, 1]. Short input is zero padded, long input is truncated.
std::vector<float> normalize(std::span<const uint8_t> bytes,
                             uint32_t sample_rate = kSampleRate,
                             uint32_t max_seconds = kMaxSeconds);

// Headerless input always passes. A RIFF/WAVE file must be 16-bit mono
// integer PCM at kSampleRate, otherwise Encoding.
std::expected<void, Error> check_wav_format(std::span<const uint8_t> bytes);

// read_file + check_wav_format + normalize.
std::expected<std::vector<float>, Error> normalize_file(const std::string& path);

} // namespace audio
