// Stitch client: push records, flush, close.
//
//   cmake -B build -DSTITCH_BUILD_EXAMPLES=ON && cmake --build build
//   STITCH_CLIENT_ID=1234 STITCH_TOKEN=... ./build/stitch_push

#include "stitch/stitch.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main() {
    const char* client_id = std::getenv("STITCH_CLIENT_ID");
    const char* token = std::getenv("STITCH_TOKEN");
    if (!client_id || !token) {
        std::cerr << "set STITCH_CLIENT_ID and STITCH_TOKEN" << std::endl;
        return 2;
    }

    try {
        auto client = stitch::Client::create(
            stitch::ClientConfig::builder(std::atoi(client_id), token, "example")
                .table_name("people")
                .key_names({"id"})
                .build());

        for (int id = 1; id <= 3; id++) {
            client->push(stitch::Message()
                .with_action(stitch::Action::Upsert)
                .with_sequence(id)
                .with_data({{"id", id}, {"name", "person " + std::to_string(id)}}));
        }

        // Switch the view of another table to a new version.
        client->push(stitch::Message()
            .with_table_name("orders")
            .with_key_names({"order_id"})
            .with_action(stitch::Action::SwitchView)
            .with_table_version(2));

        client->close();
    } catch (const stitch::StitchError& e) {
        std::cerr << "[Stitch] " << e.what() << std::endl;
        if (const auto* response = e.response()) {
            std::cerr << "  status " << response->status << " " << response->reason << std::endl;
        }
        return 1;
    }
}
