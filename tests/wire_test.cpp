// tests/wire_test.cpp
// Message -> wire mapping.

#include <gtest/gtest.h>
#include "wire.hpp"

using namespace stitch;

namespace {

ClientConfig config_with_defaults() {
    return ClientConfig::builder(42, "t", "analytics")
        .table_name("events")
        .key_names({"event_id"})
        .build();
}

} // namespace

TEST(WireTest, IdentityFieldsAlwaysPresent) {
    auto map = wire::to_mapping(Message(), config_with_defaults());
    EXPECT_EQ(map["client_id"], 42);
    EXPECT_EQ(map["namespace"], "analytics");
}

TEST(WireTest, DefaultsFillMissingTableAndKeys) {
    auto map = wire::to_mapping(Message(), config_with_defaults());
    EXPECT_EQ(map["table_name"], "events");
    EXPECT_EQ(map["key_names"], nlohmann::json::array({"event_id"}));
}

TEST(WireTest, MessageValuesOverrideDefaults) {
    auto msg = Message().with_table_name("users").with_key_names({"id", "region"});
    auto map = wire::to_mapping(msg, config_with_defaults());
    EXPECT_EQ(map["table_name"], "users");
    EXPECT_EQ(map["key_names"], nlohmann::json::array({"id", "region"}));
}

TEST(WireTest, OptionalFieldsOmittedWhenAbsent) {
    auto map = wire::to_mapping(Message(), config_with_defaults());
    EXPECT_EQ(map.size(), 4u);
    EXPECT_FALSE(map.contains("action"));
    EXPECT_FALSE(map.contains("table_version"));
    EXPECT_FALSE(map.contains("sequence"));
    EXPECT_FALSE(map.contains("data"));
}

TEST(WireTest, UnresolvableTableAndKeysOmitted) {
    auto config = ClientConfig::builder(1, "t", "ns").build();
    auto map = wire::to_mapping(Message(), config);
    EXPECT_FALSE(map.contains("table_name"));
    EXPECT_FALSE(map.contains("key_names"));
}

TEST(WireTest, AllFields) {
    auto msg = Message()
        .with_action(Action::Upsert)
        .with_table_version(3)
        .with_sequence(1700000000123)
        .with_data({{"id", 1}, {"name", "Jane"}});
    auto map = wire::to_mapping(msg, config_with_defaults());

    EXPECT_EQ(map["action"], "UPSERT");
    EXPECT_EQ(map["table_version"], 3);
    EXPECT_EQ(map["sequence"], 1700000000123);
    EXPECT_EQ(map["data"], (nlohmann::json{{"id", 1}, {"name", "Jane"}}));
    EXPECT_EQ(map.size(), 8u);
}

TEST(WireTest, SwitchViewAction) {
    auto map = wire::to_mapping(Message().with_action(Action::SwitchView), config_with_defaults());
    EXPECT_EQ(map["action"], "SWITCH_VIEW");
}

TEST(WireTest, NullDataIsKept) {
    // data was set explicitly, so it is written even though it is null.
    auto map = wire::to_mapping(Message().with_data(nullptr), config_with_defaults());
    ASSERT_TRUE(map.contains("data"));
    EXPECT_TRUE(map["data"].is_null());
}
