// src/client.cpp
// Stitch client implementation: push, flush, close.

#include "stitch/client.hpp"
#include "buffer.hpp"
#include "curl_transport.hpp"
#include "logging.hpp"
#include "response.hpp"
#include "validation.hpp"
#include "wire.hpp"

#include <mutex>

namespace stitch {

struct Client::Inner {
    ClientConfig config;
    std::unique_ptr<Transport> transport;
    std::unique_ptr<Codec> codec;
    FlushPolicy policy;
    Buffer buffer;
    std::shared_ptr<spdlog::logger> log;
    mutable std::mutex mutex;
    bool closed = false;

    Inner(ClientConfig cfg, std::unique_ptr<Transport> t, std::unique_ptr<Codec> c)
        : config(std::move(cfg)),
          transport(std::move(t)),
          codec(std::move(c)),
          policy{config.buffer_size(), config.flush_interval()},
          buffer(config.clock()()),
          log(logging::get()) {}

    // Flushes remaining data unless closed. Runs on destruction and when a
    // client is move-assigned over.
    ~Inner() {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed || buffer.empty()) return;
        try {
            flush_locked();
        } catch (const std::exception& e) {
            log->error("dropping {} unflushed messages at destruction: {}",
                       buffer.count(), e.what());
        }
    }

    HttpRequest make_request(std::vector<uint8_t> body) const {
        HttpRequest request;
        request.url = config.url();
        request.headers.emplace_back("Authorization", "Bearer " + config.token());
        request.headers.emplace_back("Content-Type", codec->content_type());
        request.body = std::move(body);
        request.connect_timeout = config.connect_timeout();
        request.response_timeout = config.response_timeout();
        return request;
    }

    // Caller holds mutex.
    void flush_locked() {
        if (buffer.empty()) return;

        std::vector<nlohmann::json> batch;
        try {
            batch = buffer.decode_all(*codec);
        } catch (const StitchError& e) {
            log->error("buffer of {} bytes is corrupted, buffered messages are at risk: {}",
                       buffer.size(), e.what());
            throw;
        }

        std::vector<uint8_t> body;
        codec->encode_batch(batch, body);
        log->debug("flushing {} messages ({} buffered bytes, {} body bytes) to {}",
                   batch.size(), buffer.size(), body.size(), config.url());

        HttpResponse http;
        try {
            http = transport->post(make_request(std::move(body)));
        } catch (const StitchError& e) {
            log->warn("flush of {} messages failed: {}", batch.size(), e.what());
            throw;
        }

        Response result;
        try {
            result = response::parse(http.status, std::move(http.reason), http.body);
            response::check(result);
        } catch (const StitchError& e) {
            log->warn("flush of {} messages failed: {}", batch.size(), e.what());
            throw;
        }

        buffer.reset(config.clock()());
        log->info("flushed {} messages (status {})", batch.size(), result.status);
    }
};

Client::Client(ClientConfig config, std::unique_ptr<Transport> transport,
               std::unique_ptr<Codec> codec) {
    if (!transport) {
        throw StitchError::configuration("transport is required");
    }
    if (!codec) {
        codec = make_codec(config.format());
    }
    inner_ = std::make_unique<Inner>(std::move(config), std::move(transport), std::move(codec));
}

Client::~Client() = default;

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

std::unique_ptr<Client> Client::create(ClientConfig config) {
    return create(std::move(config), std::make_unique<CurlTransport>());
}

std::unique_ptr<Client> Client::create(ClientConfig config,
                                       std::unique_ptr<Transport> transport,
                                       std::unique_ptr<Codec> codec) {
    return std::unique_ptr<Client>(
        new Client(std::move(config), std::move(transport), std::move(codec)));
}

void Client::push(const Message& message) {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    if (inner_->closed) {
        throw StitchError::closed();
    }

    validation::check_message(message, inner_->config);
    inner_->buffer.append(*inner_->codec, wire::to_mapping(message, inner_->config));

    if (inner_->policy.should_flush(inner_->buffer, inner_->config.clock()())) {
        inner_->flush_locked();
    }
}

void Client::flush() {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    inner_->flush_locked();
}

void Client::close() {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    inner_->flush_locked();
    inner_->closed = true;
}

size_t Client::buffered_bytes() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->buffer.size();
}

size_t Client::buffered_messages() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->buffer.count();
}

std::chrono::steady_clock::time_point Client::last_flush_time() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->buffer.last_flush();
}

const ClientConfig& Client::config() const noexcept {
    return inner_->config;
}

} // namespace stitch
