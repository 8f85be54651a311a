// src/config.cpp
// Configuration builder.

#include "stitch/config.hpp"
#include "validation.hpp"

namespace stitch {

ClientConfigBuilder ClientConfig::builder(int client_id, const std::string& token,
                                          const std::string& ns) {
    return ClientConfigBuilder(client_id, token, ns);
}

// --- ClientConfigBuilder ---

ClientConfigBuilder::ClientConfigBuilder(int client_id, const std::string& token,
                                         const std::string& ns) {
    config_.client_id_ = client_id;
    config_.token_ = token;
    config_.namespace_ = ns;
}

ClientConfigBuilder& ClientConfigBuilder::url(std::string url) {
    config_.url_ = std::move(url);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::table_name(std::string table_name) {
    config_.table_name_ = std::move(table_name);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::key_names(std::vector<std::string> key_names) {
    config_.key_names_ = std::move(key_names);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::flush_interval(std::chrono::milliseconds interval) {
    config_.flush_interval_ = interval;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::buffer_size(size_t bytes) {
    config_.buffer_size_ = bytes;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::response_timeout(std::chrono::milliseconds timeout) {
    config_.response_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::format(WireFormat format) {
    config_.format_ = format;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::clock(ClientConfig::Clock clock) {
    config_.clock_ = std::move(clock);
    return *this;
}

ClientConfig ClientConfigBuilder::build() const {
    validation::validate_config(config_);
    return config_;
}

} // namespace stitch
