#include "curl_transport.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <print>

namespace {

std::mutex g_curl_mutex;
int g_curl_refcount = 0;

bool acquire_curl_global() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount == 0) {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            std::println(stderr, "http: curl_global_init failed: {}", curl_easy_strerror(rc));
            return false;
        }
    }
    ++g_curl_refcount;
    return true;
}

void release_curl_global() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount > 0 && --g_curl_refcount == 0) {
        curl_global_cleanup();
    }
}

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

bool append_header(HeaderList& list, const std::string& line) {
    curl_slist* next = curl_slist_append(list.get(), line.c_str());
    if (!next) return false;
    // curl_slist_append keeps the head once the list is non-empty
    if (!list) list.reset(next);
    return true;
}

} // namespace

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options)
    : options_(options), global_ok_(acquire_curl_global()) {}

CurlTransport::~CurlTransport() {
    if (global_ok_) release_curl_global();
}

std::expected<HttpResponse, Error> CurlTransport::post(const HttpRequest& request) {
    if (!global_ok_) {
        return std::unexpected(Error{ErrorKind::Transport, "libcurl not initialized"});
    }

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(Error{ErrorKind::Transport, "curl_easy_init failed"});
    }

    HeaderList headers;
    bool headers_ok = append_header(headers, "Content-Type: " + request.content_type) &&
                      append_header(headers, "Expect:");
    for (auto& [name, value] : request.headers) {
        headers_ok = headers_ok && append_header(headers, name + ": " + value);
    }
    if (!headers_ok) {
        return std::unexpected(Error{ErrorKind::Transport, "failed to build request headers"});
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    // A null POSTFIELDS would make curl fall back to reading stdin.
    const char* body = request.body.empty()
        ? "" : reinterpret_cast<const char*>(request.body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.read_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorKind::Transport,
                                     std::string("curl error: ") + curl_easy_strerror(res)});
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
