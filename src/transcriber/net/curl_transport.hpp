#pragma once

#include "http_transport.hpp"

class CurlTransport : public HttpTransport {
public:
    struct Options {
        long connect_timeout_s = 30;
        // Abort when no bytes move for this long.
        long read_timeout_s = 30;
    };

    CurlTransport();
    explicit CurlTransport(Options options);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, Error> post(const HttpRequest& request) override;

private:
    Options options_;
    bool global_ok_ = false;
};
