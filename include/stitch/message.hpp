// include/stitch/message.hpp
// One change to one destination table.

#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stitch {

// A record submitted through Client::push.
//
// Every attribute is optional. Table name and key names fall back to the
// client defaults when absent.
//
// Example:
//   auto msg = Message()
//       .with_table_name("users")
//       .with_key_names({"id"})
//       .with_action(Action::Upsert)
//       .with_sequence(1)
//       .with_data({{"id", 1}, {"name", "Jane"}});
class Message {
public:
    Message& with_table_name(std::string table_name) {
        table_name_ = std::move(table_name);
        return *this;
    }

    Message& with_key_names(std::vector<std::string> key_names) {
        key_names_ = std::move(key_names);
        return *this;
    }

    Message& with_action(Action action) {
        action_ = action;
        return *this;
    }

    Message& with_table_version(int64_t version) {
        table_version_ = version;
        return *this;
    }

    Message& with_sequence(int64_t sequence) {
        sequence_ = sequence;
        return *this;
    }

    Message& with_data(nlohmann::json data) {
        data_ = std::move(data);
        return *this;
    }

    const std::optional<std::string>& table_name() const noexcept { return table_name_; }
    const std::optional<std::vector<std::string>>& key_names() const noexcept { return key_names_; }
    const std::optional<Action>& action() const noexcept { return action_; }
    const std::optional<int64_t>& table_version() const noexcept { return table_version_; }
    const std::optional<int64_t>& sequence() const noexcept { return sequence_; }
    const std::optional<nlohmann::json>& data() const noexcept { return data_; }

private:
    std::optional<std::string> table_name_;
    std::optional<std::vector<std::string>> key_names_;
    std::optional<Action> action_;
    std::optional<int64_t> table_version_;
    std::optional<int64_t> sequence_;
    std::optional<nlohmann::json> data_;
};

} // namespace stitch
