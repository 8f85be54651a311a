// src/response.cpp

#include "response.hpp"

#include <algorithm>
#include <cctype>

namespace stitch {

namespace {

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool has_error_indicator(const nlohmann::json& body) {
    if (!body.is_object()) return false;

    auto error = body.find("error");
    if (error != body.end() && !error->is_null()) return true;

    auto errors = body.find("errors");
    if (errors != body.end() && !errors->is_null() && !errors->empty()) return true;

    auto status = body.find("status");
    if (status != body.end() && status->is_string() &&
        !iequals(status->get_ref<const std::string&>(), "ok")) {
        return true;
    }
    return false;
}

} // namespace

bool Response::ok() const {
    return is_success_status(status) && !has_error_indicator(body);
}

namespace response {

Response parse(int status, std::string reason, const std::vector<uint8_t>& body) {
    Response result;
    result.status = status;
    result.reason = std::move(reason);

    bool blank = std::all_of(body.begin(), body.end(), [](uint8_t c) {
        return std::isspace(c) != 0;
    });
    if (blank) return result;

    try {
        result.body = nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error& e) {
        if (is_success_status(status)) {
            throw StitchError::transport("malformed response body (status " +
                                         std::to_string(status) + "): " + e.what());
        }
        result.body = std::string(body.begin(), body.end());
        return result;
    }
    if (!result.body.is_object() && is_success_status(status)) {
        throw StitchError::transport("malformed response body (status " +
                                     std::to_string(status) + "): expected an object, got " +
                                     result.body.type_name());
    }
    return result;
}

void check(const Response& response) {
    if (!response.ok()) {
        throw StitchError::rejected(response);
    }
}

} // namespace response
} // namespace stitch
