#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Builds a multipart/form-data body (RFC 2388 layout): every form field in
// insertion order, then the file part, then the closing delimiter.
class MultipartEncoder {
public:
    struct FilePart {
        std::string field_name;
        std::string file_name;
        std::string mime_type;
        std::vector<uint8_t> data;
    };

    // Random boundary, fixed for the lifetime of the encoder.
    MultipartEncoder();
    explicit MultipartEncoder(std::string boundary);

    void add_field(std::string name, std::string value);
    void set_file(std::string field_name, std::string file_name, std::string mime_type,
                  std::vector<uint8_t> data);

    const std::string& boundary() const { return boundary_; }
    std::string content_type() const;

    // Fails with ErrorKind::Encoding if the boundary occurs inside any value or
    // the file bytes, or a field name or MIME type would break out of its header.
    // The filename is percent-escaped instead (" CR LF as %22 %0D %0A).
    std::expected<std::vector<uint8_t>, Error> encode() const;

    static std::string random_boundary();

private:
    std::string boundary_;
    std::vector<std::pair<std::string, std::string>> fields_;
    std::optional<FilePart> file_;
};
