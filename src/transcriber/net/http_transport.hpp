#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string content_type;   // multipart/form-data; boundary=...
    std::vector<uint8_t> body;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Issues a POST and returns whatever the server answered. Only connection
// level failures are errors here; status codes are left to classify_response().
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, Error> post(const HttpRequest& request) = 0;
};

// 429 -> RateLimited, any other status >= 400 -> Transport (body kept in the
// message), anything else -> the body.
std::expected<std::string, Error> classify_response(HttpResponse response);

std::expected<std::string, Error> send(HttpTransport& transport, const HttpRequest& request);
