#include "cloud_provider.hpp"

#include "../audio/preprocessor.hpp"
#include "../net/multipart.hpp"
#include "../outcome.hpp"

#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string infer_mime_type(const std::string& file_name, const std::string& explicit_type) {
    if (!explicit_type.empty()) return explicit_type;

    auto ends_with = [&file_name](std::string_view ext) { return file_name.ends_with(ext); };
    if (ends_with(".ogg")) return "audio/ogg";
    if (ends_with(".mp3")) return "audio/mpeg";
    if (ends_with(".wav")) return "audio/wav";
    if (ends_with(".m4a")) return "audio/mp4";
    // Voice notes are Opus in OGG
    return "audio/ogg";
}

std::string normalize_api_key(const std::string& key) {
    std::string out = key;
    std::erase(out, ' ');
    return trim(out);
}

CloudProvider::CloudProvider(HttpTransport& transport) : transport_(transport) {}

std::expected<void, Error> CloudProvider::check_available(const ProviderConfig& config) const {
    if (!config.cloud.enabled) {
        return std::unexpected(Error{ErrorKind::Unavailable, "cloud transcription disabled"});
    }
    if (normalize_api_key(config.cloud.api_key).empty()) {
        return std::unexpected(Error{ErrorKind::Unavailable, "no API key configured"});
    }
    return {};
}

std::expected<std::string, Error>
CloudProvider::transcribe(const TranscriptionRequest& request, const ProviderConfig& config) {
    auto audio = audio::read_file(request.file_path);
    if (!audio) return std::unexpected(std::move(audio.error()));

    auto file_name = fs::path(request.file_path).filename().string();

    MultipartEncoder form;
    form.add_field("model", config.cloud.model);
    if (!request.prompt_hint.empty()) {
        form.add_field("prompt", request.prompt_hint);
    }
    form.set_file("file", file_name, infer_mime_type(file_name, request.mime_type),
                  std::move(*audio));

    auto body = form.encode();
    if (!body) return std::unexpected(std::move(body.error()));

    HttpRequest http{
        .url = config.cloud.endpoint,
        .headers = {{"Authorization", "Bearer " + normalize_api_key(config.cloud.api_key)}},
        .content_type = form.content_type(),
        .body = std::move(*body),
    };

    auto response = send(transport_, http);
    if (!response) return std::unexpected(std::move(response.error()));

    try {
        auto j = json::parse(*response);
        if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
            std::println(stderr, "cloud: no text field in response: {}", *response);
            return std::unexpected(Error{ErrorKind::Parse, "no text field in response"});
        }
        return j["text"].get<std::string>();
    } catch (const json::exception& e) {
        std::println(stderr, "cloud: unparseable response: {}", *response);
        return std::unexpected(Error{ErrorKind::Parse,
                                     std::string("JSON parse error: ") + e.what()});
    }
}
