// src/wire.cpp
// Message -> wire mapping.

#include "wire.hpp"

#include "stitch/types.hpp"

namespace stitch {
namespace wire {

namespace {

template <typename T>
void put_with_default(nlohmann::json& map, const char* key, const std::optional<T>& value,
                      const std::optional<T>& fallback) {
    if (value) {
        map[key] = *value;
    } else if (fallback) {
        map[key] = *fallback;
    }
}

template <typename T>
void put_if_present(nlohmann::json& map, const char* key, const std::optional<T>& value) {
    if (value) map[key] = *value;
}

} // namespace

nlohmann::json to_mapping(const Message& message, const ClientConfig& config) {
    nlohmann::json map = nlohmann::json::object();

    map[Field::CLIENT_ID] = config.client_id();
    map[Field::NAMESPACE] = config.namespace_name();

    put_with_default(map, Field::TABLE_NAME, message.table_name(), config.table_name());
    put_with_default(map, Field::KEY_NAMES, message.key_names(), config.key_names());

    if (message.action()) {
        map[Field::ACTION] = action_name(*message.action());
    }
    put_if_present(map, Field::TABLE_VERSION, message.table_version());
    put_if_present(map, Field::SEQUENCE, message.sequence());
    put_if_present(map, Field::DATA, message.data());

    return map;
}

} // namespace wire
} // namespace stitch
