#pragma once

#include <pkgindex/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pkgindex {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    int timeout_seconds = 0;  // 0 = no limit
};

// Status line and headers of the final response (after redirects).
// Header names are stored lowercased.
struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;

    // Case-insensitive lookup
    std::optional<std::string> header(const std::string& name) const;
};

// Receives one response. begin() runs once, before any body bytes, even for
// an empty body; write() may run any number of times; finish() runs after
// the transfer completed. An error from any of them aborts the transfer and
// is returned from HttpClient::get() unchanged.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;
    virtual Status begin(const HttpResponse& head) = 0;
    virtual Status write(const char* data, size_t size) = 0;
    virtual Status finish() = 0;
};

// A non-2xx status is not an error here: the handler decides what a
// status means. Only transport failures (Network, Timeout) are reported.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> get(const HttpRequest& req,
                                     ResponseHandler& handler) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> get(const HttpRequest& req,
                             ResponseHandler& handler) override;
};

} // namespace pkgindex
