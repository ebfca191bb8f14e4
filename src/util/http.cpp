#include <pkgindex/http.hpp>
#include <pkgindex/log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string_view>

namespace pkgindex {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](char c) -> char {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) curl_slist_free_all(list);
    }
};
using SlistHandle = std::unique_ptr<curl_slist, SlistDeleter>;

// State shared between the curl callbacks of one transfer
struct Transfer {
    CURL* curl = nullptr;
    ResponseHandler* handler = nullptr;
    HttpResponse head;
    bool began = false;
    std::optional<IndexError> handler_error;

    bool ensure_begun() {
        if (began) return true;
        began = true;
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        head.status = code;
        auto s = handler->begin(head);
        if (s.is_err()) {
            handler_error = std::move(s).error();
            return false;
        }
        return true;
    }
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* self) {
    auto* t = static_cast<Transfer*>(self);
    std::string_view line(buffer, size * nitems);

    // A new status line starts a new response (redirect or 100-continue)
    if (line.substr(0, 5) == "HTTP/") {
        t->head.headers.clear();
        return size * nitems;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        std::string key = to_lower(std::string(line.substr(0, colon)));
        size_t start = colon + 1;
        while (start < line.size() && (line[start] == ' ' || line[start] == '\t')) {
            ++start;
        }
        size_t end = line.find_first_of("\r\n", start);
        if (end == std::string_view::npos) end = line.size();
        t->head.headers[key] = std::string(line.substr(start, end - start));
    }
    return size * nitems;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* self) {
    auto* t = static_cast<Transfer*>(self);
    size_t bytes = size * nmemb;
    if (!t->ensure_begun()) return 0;

    auto s = t->handler->write(ptr, bytes);
    if (s.is_err()) {
        t->handler_error = std::move(s).error();
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    return bytes;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

Result<HttpResponse> CurlHttpClient::get(const HttpRequest& req,
                                         ResponseHandler& handler) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return IndexError{IndexError::Network, "curl_easy_init failed"};
    }

    SlistHandle headers;
    for (const auto& [name, value] : req.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            return IndexError{IndexError::Network,
                "cannot build request headers for " + req.url};
        }
        headers.release();
        headers.reset(appended);
    }

    Transfer transfer;
    transfer.curl = curl.get();
    transfer.handler = &handler;

    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    if (req.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                         static_cast<long>(req.timeout_seconds));
    }

    log::debug("GET %s", req.url.c_str());
    CURLcode res = curl_easy_perform(curl.get());

    if (transfer.handler_error) {
        return std::move(*transfer.handler_error);
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return IndexError{IndexError::Timeout,
            "request to " + req.url + " timed out after " +
            std::to_string(req.timeout_seconds) + "s"};
    }
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return IndexError{IndexError::Network,
            "request to " + req.url + " failed: " + detail};
    }

    // Empty bodies never reach write_callback
    if (!transfer.ensure_begun()) {
        return std::move(*transfer.handler_error);
    }
    auto fin = handler.finish();
    if (fin.is_err()) return std::move(fin).error();

    log::debug("GET %s -> %ld", req.url.c_str(), transfer.head.status);
    return Result<HttpResponse>::ok(std::move(transfer.head));
}

} // namespace pkgindex
