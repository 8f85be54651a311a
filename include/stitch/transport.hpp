// include/stitch/transport.hpp
// Blocking HTTP request/response used to deliver batches.

#pragma once

#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace stitch {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds response_timeout{0};  // 0 = unlimited
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::vector<uint8_t> body;
};

// Sends one POST and blocks until the response arrives.
//
// Implementations throw StitchError of kind Transport when no HTTP response
// could be obtained. Any status code, including 4xx/5xx, is a normal return.
class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

} // namespace stitch
