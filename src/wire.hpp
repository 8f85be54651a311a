// src/wire.hpp
// Message -> wire mapping.

#pragma once

#include "stitch/config.hpp"
#include "stitch/message.hpp"

#include <nlohmann/json.hpp>

namespace stitch {
namespace wire {

// Build the mapping sent for one message. client_id and namespace come from
// the config; table_name and key_names use the message value, else the config
// default; action, table_version, sequence and data appear only when set on
// the message. Nothing is written as null.
nlohmann::json to_mapping(const Message& message, const ClientConfig& config);

} // namespace wire
} // namespace stitch
