// include/stitch/config.hpp
// Immutable client configuration with builder pattern.

#pragma once

#include "error.hpp"
#include "types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stitch {

class ClientConfigBuilder;

// Configuration for a Stitch client.
class ClientConfig {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr const char* DEFAULT_URL = "https://pipeline-gateway.rjmetrics.com/push";

    static ClientConfigBuilder builder(int client_id, const std::string& token,
                                       const std::string& ns);

    const std::string& url() const noexcept { return url_; }
    int client_id() const noexcept { return client_id_; }
    const std::string& token() const noexcept { return token_; }
    const std::string& namespace_name() const noexcept { return namespace_; }
    const std::optional<std::string>& table_name() const noexcept { return table_name_; }
    const std::optional<std::vector<std::string>>& key_names() const noexcept { return key_names_; }
    std::chrono::milliseconds flush_interval() const noexcept { return flush_interval_; }
    size_t buffer_size() const noexcept { return buffer_size_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    std::chrono::milliseconds response_timeout() const noexcept { return response_timeout_; }
    WireFormat format() const noexcept { return format_; }
    const Clock& clock() const noexcept { return clock_; }

private:
    friend class ClientConfigBuilder;

    std::string url_ = DEFAULT_URL;
    int client_id_ = 0;
    std::string token_;
    std::string namespace_;
    std::optional<std::string> table_name_;
    std::optional<std::vector<std::string>> key_names_;
    std::chrono::milliseconds flush_interval_{60000};
    size_t buffer_size_ = 4096;
    std::chrono::milliseconds connect_timeout_{120000};
    std::chrono::milliseconds response_timeout_{300000};
    WireFormat format_ = WireFormat::TransitJson;
    Clock clock_ = [] { return std::chrono::steady_clock::now(); };
};

// Fluent builder for ClientConfig.
class ClientConfigBuilder {
public:
    ClientConfigBuilder(int client_id, const std::string& token, const std::string& ns);

    ClientConfigBuilder& url(std::string url);
    ClientConfigBuilder& table_name(std::string table_name);
    ClientConfigBuilder& key_names(std::vector<std::string> key_names);
    ClientConfigBuilder& flush_interval(std::chrono::milliseconds interval);
    ClientConfigBuilder& buffer_size(size_t bytes);
    ClientConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    // 0 disables the limit.
    ClientConfigBuilder& response_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& format(WireFormat format);
    ClientConfigBuilder& clock(ClientConfig::Clock clock);

    // Build the config. Throws StitchError on invalid settings.
    ClientConfig build() const;

private:
    ClientConfig config_;
};

} // namespace stitch
