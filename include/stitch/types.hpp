// include/stitch/types.hpp
// Core enums, wire field names and the gateway response.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace stitch {

// What the gateway should do with a record.
enum class Action : uint8_t {
    Upsert,
    SwitchView,
};

// Wire string for an action ("UPSERT" / "SWITCH_VIEW").
inline const char* action_name(Action action) noexcept {
    switch (action) {
        case Action::Upsert:     return "UPSERT";
        case Action::SwitchView: return "SWITCH_VIEW";
    }
    return "UPSERT";
}

// Serialization used for the buffer and the request body.
enum class WireFormat : uint8_t {
    TransitJson,  // application/transit+json (gateway default)
    Json,         // application/json
};

// Keys of a wire mapping.
struct Field {
    static constexpr const char* CLIENT_ID     = "client_id";
    static constexpr const char* NAMESPACE     = "namespace";
    static constexpr const char* ACTION        = "action";
    static constexpr const char* TABLE_NAME    = "table_name";
    static constexpr const char* TABLE_VERSION = "table_version";
    static constexpr const char* KEY_NAMES     = "key_names";
    static constexpr const char* SEQUENCE      = "sequence";
    static constexpr const char* DATA          = "data";
};

// Acknowledgement returned by the gateway for one batch.
struct Response {
    int status = 0;
    std::string reason;
    nlohmann::json body = nlohmann::json::object();

    // 2xx and no error reported inside the body.
    bool ok() const;
};

} // namespace stitch
