// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "stitch/config.hpp"
#include "stitch/error.hpp"
#include "stitch/message.hpp"

#include <string>
#include <vector>

namespace stitch {
namespace validation {

inline bool check_url(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

// A key-name list is usable when non-empty and free of empty names.
inline bool check_key_names(const std::vector<std::string>& key_names) {
    if (key_names.empty()) return false;
    for (const auto& name : key_names) {
        if (name.empty()) return false;
    }
    return true;
}

inline void validate_config(const ClientConfig& config) {
    if (config.client_id() <= 0) {
        throw StitchError::configuration(
            "client_id must be positive, got " + std::to_string(config.client_id()));
    }
    if (config.token().empty()) {
        throw StitchError::configuration("token is required");
    }
    if (config.namespace_name().empty()) {
        throw StitchError::configuration("namespace is required");
    }
    if (!check_url(config.url())) {
        throw StitchError::configuration("url must start with http:// or https://, got: " +
                                         config.url());
    }
    if (config.flush_interval().count() < 0) {
        throw StitchError::configuration("flush_interval must not be negative");
    }
    if (config.connect_timeout().count() < 0 || config.response_timeout().count() < 0) {
        throw StitchError::configuration("timeouts must not be negative");
    }
    if (config.table_name() && config.table_name()->empty()) {
        throw StitchError::configuration("default table_name must not be empty");
    }
    if (config.key_names() && !check_key_names(*config.key_names())) {
        throw StitchError::configuration("default key_names must be non-empty names");
    }
    if (!config.clock()) {
        throw StitchError::configuration("clock must be callable");
    }
}

// Table name and key names must resolve from the message or the defaults.
inline void check_message(const Message& message, const ClientConfig& config) {
    const auto& table = message.table_name() ? message.table_name() : config.table_name();
    if (!table || table->empty()) {
        throw StitchError::validation("table_name", "is required (no message value or default)");
    }
    const auto& keys = message.key_names() ? message.key_names() : config.key_names();
    if (!keys || !check_key_names(*keys)) {
        throw StitchError::validation("key_names", "is required (no message value or default)");
    }
}

} // namespace validation
} // namespace stitch
