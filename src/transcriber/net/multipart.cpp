#include "multipart.hpp"

#include <algorithm>
#include <random>
#include <string_view>

namespace {

constexpr std::string_view kCrlf = "\r\n";

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool contains(const std::vector<uint8_t>& haystack, std::string_view needle) {
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                       [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); })
        != haystack.end();
}

bool safe_header_value(std::string_view s) {
    return s.find_first_of("\"\r\n") == std::string_view::npos;
}

// Form-data filename escaping as browsers do it (WHATWG / RFC 7578).
std::string escape_file_name(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "%22"; break;
            case '\r': out += "%0D"; break;
            case '\n': out += "%0A"; break;
            default: out += c;
        }
    }
    return out;
}

void append(std::vector<uint8_t>& out, std::string_view s) {
    out.insert(out.end(), s.begin(), s.end());
}

} // namespace

MultipartEncoder::MultipartEncoder() : boundary_(random_boundary()) {}

MultipartEncoder::MultipartEncoder(std::string boundary) : boundary_(std::move(boundary)) {}

std::string MultipartEncoder::random_boundary() {
    static constexpr char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 15);

    std::string b = "----voxscribe";
    for (int i = 0; i < 32; ++i) b += hex[dist(rd)];
    return b;
}

void MultipartEncoder::add_field(std::string name, std::string value) {
    fields_.emplace_back(std::move(name), std::move(value));
}

void MultipartEncoder::set_file(std::string field_name, std::string file_name,
                                std::string mime_type, std::vector<uint8_t> data) {
    file_ = FilePart{std::move(field_name), std::move(file_name), std::move(mime_type),
                     std::move(data)};
}

std::string MultipartEncoder::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::expected<std::vector<uint8_t>, Error> MultipartEncoder::encode() const {
    if (boundary_.empty() || !safe_header_value(boundary_)) {
        return std::unexpected(Error{ErrorKind::Encoding, "invalid boundary"});
    }

    for (auto& [name, value] : fields_) {
        if (!safe_header_value(name)) {
            return std::unexpected(Error{ErrorKind::Encoding, "invalid field name: " + name});
        }
        if (contains(value, boundary_)) {
            return std::unexpected(Error{ErrorKind::Encoding,
                                         "boundary collides with field " + name});
        }
    }

    if (file_) {
        if (!safe_header_value(file_->field_name) || !safe_header_value(file_->mime_type)) {
            return std::unexpected(Error{ErrorKind::Encoding,
                                         "invalid file part header: " + file_->field_name});
        }
        if (contains(file_->data, boundary_)) {
            return std::unexpected(Error{ErrorKind::Encoding,
                                         "boundary collides with file content"});
        }
    }

    const std::string delimiter = "--" + boundary_;
    std::vector<uint8_t> out;
    out.reserve(256 + (file_ ? file_->data.size() : 0));

    for (auto& [name, value] : fields_) {
        append(out, delimiter);
        append(out, kCrlf);
        append(out, "Content-Disposition: form-data; name=\"" + name + "\"");
        append(out, kCrlf);
        append(out, kCrlf);
        append(out, value);
        append(out, kCrlf);
    }

    if (file_) {
        append(out, delimiter);
        append(out, kCrlf);
        append(out, "Content-Disposition: form-data; name=\"" + file_->field_name +
                    "\"; filename=\"" + escape_file_name(file_->file_name) + "\"");
        append(out, kCrlf);
        append(out, "Content-Type: " + file_->mime_type);
        append(out, kCrlf);
        append(out, kCrlf);
        out.insert(out.end(), file_->data.begin(), file_->data.end());
        append(out, kCrlf);
    }

    append(out, delimiter);
    append(out, "--");
    append(out, kCrlf);
    return out;
}
