#include "http_transport.hpp"

#include <format>
#include <print>

std::expected<std::string, Error> classify_response(HttpResponse response) {
    if (response.status == 429) {
        return std::unexpected(Error{ErrorKind::RateLimited, std::move(response.body)});
    }
    if (response.status >= 400) {
        std::println(stderr, "http: error {}: {}", response.status, response.body);
        return std::unexpected(Error{ErrorKind::Transport,
                                     std::format("HTTP error {}: {}", response.status,
                                                 response.body)});
    }
    return std::move(response.body);
}

std::expected<std::string, Error> send(HttpTransport& transport, const HttpRequest& request) {
    auto response = transport.post(request);
    if (!response) return std::unexpected(std::move(response.error()));
    return classify_response(std::move(*response));
}
