// src/curl_transport.cpp
// libcurl transport.

#include "curl_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>

namespace stitch {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t on_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    size_t n = size * nmemb;
    body->insert(body->end(), reinterpret_cast<uint8_t*>(data),
                 reinterpret_cast<uint8_t*>(data) + n);
    return n;
}

// Keeps the reason phrase of the last status line ("HTTP/1.1 200 OK").
// Interim 1xx responses are overwritten by the final one.
size_t on_header(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* reason = static_cast<std::string*>(userdata);
    size_t n = size * nmemb;
    std::string line(data, n);
    if (line.rfind("HTTP/", 0) == 0) {
        auto code_start = line.find(' ');
        auto reason_start = code_start == std::string::npos
            ? std::string::npos : line.find(' ', code_start + 1);
        if (reason_start == std::string::npos) {
            reason->clear();
        } else {
            auto text = line.substr(reason_start + 1);
            while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) text.pop_back();
            *reason = std::move(text);
        }
    }
    return n;
}

void check(CURLcode code, const char* what) {
    if (code != CURLE_OK) {
        throw StitchError::transport(std::string(what) + ": " + curl_easy_strerror(code));
    }
}

} // namespace

CurlTransport::CurlTransport() {
    static std::once_flag once;
    static CURLcode init_result = CURLE_OK;
    std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    check(init_result, "curl_global_init");
}

HttpResponse CurlTransport::post(const HttpRequest& request) {
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        throw StitchError::transport("curl_easy_init failed");
    }
    CURL* curl = handle.get();

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            throw StitchError::transport("curl_slist_append failed");
        }
        headers.release();
        headers.reset(appended);
    }
    // Suppress "Expect: 100-continue" round trips on large batches.
    curl_slist* appended = curl_slist_append(headers.get(), "Expect:");
    if (!appended) {
        throw StitchError::transport("curl_slist_append failed");
    }
    headers.release();
    headers.reset(appended);

    HttpResponse response;
    char error_buf[CURL_ERROR_SIZE] = {};

    check(curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buf), "CURLOPT_ERRORBUFFER");
    check(curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str()), "CURLOPT_URL");
    check(curl_easy_setopt(curl, CURLOPT_POST, 1L), "CURLOPT_POST");
    const char* fields = request.body.empty()
        ? "" : reinterpret_cast<const char*>(request.body.data());
    check(curl_easy_setopt(curl, CURLOPT_POSTFIELDS, fields), "CURLOPT_POSTFIELDS");
    check(curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                           static_cast<curl_off_t>(request.body.size())),
          "CURLOPT_POSTFIELDSIZE_LARGE");
    check(curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get()), "CURLOPT_HTTPHEADER");
    check(curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                           static_cast<long>(request.connect_timeout.count())),
          "CURLOPT_CONNECTTIMEOUT_MS");
    check(curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                           static_cast<long>(request.response_timeout.count())),
          "CURLOPT_TIMEOUT_MS");
    check(curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L), "CURLOPT_NOSIGNAL");
    check(curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &on_body), "CURLOPT_WRITEFUNCTION");
    check(curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body), "CURLOPT_WRITEDATA");
    check(curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &on_header), "CURLOPT_HEADERFUNCTION");
    check(curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.reason), "CURLOPT_HEADERDATA");

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string detail = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(rc);
        throw StitchError::transport("POST " + request.url + " failed: " + detail);
    }

    long status = 0;
    check(curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status), "CURLINFO_RESPONSE_CODE");
    response.status = static_cast<int>(status);
    return response;
}

} // namespace stitch
