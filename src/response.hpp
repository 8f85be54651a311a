// src/response.hpp
// Gateway acknowledgement parsing and validation.

#pragma once

#include "stitch/error.hpp"
#include "stitch/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stitch {
namespace response {

// Build a Response from the raw HTTP reply. An empty body becomes {}.
// Throws Transport when a 2xx reply carries a body that is not a JSON
// object. A non-2xx reply keeps any body as detail, unparseable text as a
// JSON string.
Response parse(int status, std::string reason, const std::vector<uint8_t>& body);

// Throws Rejected carrying the response unless it is ok().
void check(const Response& response);

} // namespace response
} // namespace stitch
