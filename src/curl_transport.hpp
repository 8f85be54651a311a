// src/curl_transport.hpp
// libcurl transport: one easy handle per request.

#pragma once

#include "stitch/transport.hpp"

namespace stitch {

class CurlTransport : public Transport {
public:
    CurlTransport();
    ~CurlTransport() override = default;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    // POST request.body to request.url. Throws StitchError (Transport) when
    // the connection, the timeout or the HTTP exchange fails.
    HttpResponse post(const HttpRequest& request) override;
};

} // namespace stitch
