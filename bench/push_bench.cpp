// bench/push_bench.cpp
// Push hot path and flush encoding against a transport that discards batches.

#include <benchmark/benchmark.h>
#include "buffer.hpp"
#include "stitch/stitch.hpp"

#include <chrono>

using namespace stitch;

namespace {

class NullTransport : public Transport {
public:
    HttpResponse post(const HttpRequest&) override {
        return HttpResponse{200, "OK", {}};
    }
};

std::unique_ptr<Client> make_client(size_t buffer_size, WireFormat format) {
    auto config = ClientConfig::builder(1, "token", "bench")
        .table_name("events")
        .key_names({"id"})
        .buffer_size(buffer_size)
        .flush_interval(std::chrono::milliseconds(3600000))
        .format(format)
        .build();
    return Client::create(std::move(config), std::make_unique<NullTransport>());
}

Message sample(int64_t i) {
    return Message()
        .with_action(Action::Upsert)
        .with_sequence(i)
        .with_data({{"id", i}, {"url", "/dashboard/analytics/overview"},
                    {"referrer", "https://www.google.com/search?q=analytics"},
                    {"screen_width", 1920}, {"screen_height", 1080}});
}

} // namespace

// Buffering only; large threshold keeps flushes out of the loop.
static void BM_PushBuffered(benchmark::State& state) {
    auto client = make_client(size_t(1) << 30, static_cast<WireFormat>(state.range(0)));
    int64_t i = 0;
    for (auto _ : state) {
        client->push(sample(i++));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PushBuffered)
    ->Arg(static_cast<int>(WireFormat::TransitJson))
    ->Arg(static_cast<int>(WireFormat::Json));

// Push with the default 4 KB threshold, flushing every few messages.
static void BM_PushWithFlush(benchmark::State& state) {
    auto client = make_client(4096, WireFormat::TransitJson);
    int64_t i = 0;
    for (auto _ : state) {
        client->push(sample(i++));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PushWithFlush);

// Decode a buffer of N messages and encode the batch body.
static void BM_FlushEncode(benchmark::State& state) {
    TransitJsonCodec codec;
    Buffer buffer(std::chrono::steady_clock::now());
    for (int64_t i = 0; i < state.range(0); i++) {
        buffer.append(codec, nlohmann::json{{"id", i}, {"table_name", "events"}});
    }
    for (auto _ : state) {
        std::vector<uint8_t> body;
        codec.encode_batch(buffer.decode_all(codec), body);
        benchmark::DoNotOptimize(body.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * buffer.size()));
}
BENCHMARK(BM_FlushEncode)->Arg(10)->Arg(100)->Arg(1000);
