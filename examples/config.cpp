// Full ClientConfig builder: all available options with defaults.
//
//   cmake -B build -DSTITCH_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/stitch_config

#include "stitch/stitch.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto config = stitch::ClientConfig::builder(1234, "token", "namespace")
        .url("https://pipeline-gateway.rjmetrics.com/push")     // default gateway
        .table_name("events")                                   // default: none
        .key_names({"id"})                                      // default: none
        .flush_interval(std::chrono::milliseconds(60000))       // default: 60s between flushes
        .buffer_size(4096)                                      // default: 4 KB
        .connect_timeout(std::chrono::milliseconds(120000))     // default: 2 min
        .response_timeout(std::chrono::milliseconds(300000))    // default: 5 min, 0 = unlimited
        .format(stitch::WireFormat::TransitJson)                // default: transit+json
        .build();

    std::cout << "url:            " << config.url() << "\n"
              << "buffer_size:    " << config.buffer_size() << " bytes\n"
              << "flush_interval: " << config.flush_interval().count() << " ms\n";
}
