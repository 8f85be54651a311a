// include/stitch/client.hpp
// Buffered Stitch push client.

#pragma once

#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>

namespace stitch {

// The Stitch client.
//
// Messages are encoded into an in-memory buffer. After every push the buffer
// is flushed when it reached buffer_size bytes or when flush_interval elapsed
// since the last successful flush. Flushing happens inline on the calling
// thread; there is no background timer. Calls are serialized by an internal
// mutex.
//
// Every error propagates to the caller and leaves buffered data in place.
//
// Example:
//   auto client = Client::create(
//       ClientConfig::builder(1234, "token", "events").table_name("users")
//           .key_names({"id"}).build());
//   client->push(Message().with_action(Action::Upsert).with_data({{"id", 1}}));
//   client->close();
class Client {
public:
    // Client with the codec named by config.format() and a libcurl transport.
    static std::unique_ptr<Client> create(ClientConfig config);

    // Client with an injected transport; codec defaults to config.format().
    static std::unique_ptr<Client> create(ClientConfig config,
                                          std::unique_ptr<Transport> transport,
                                          std::unique_ptr<Codec> codec = nullptr);

    // Flushes remaining data unless closed; failures are logged. Move
    // assignment does the same for the client being replaced.
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    // A moved-from client may only be destroyed or assigned to.
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // Buffer one message, flushing when a trigger fires.
    // Throws Validation, Closed, or any flush error.
    void push(const Message& message);

    // Send everything buffered as one batch. No-op when empty.
    void flush();

    // Final flush. Safe to call repeatedly.
    void close();

    size_t buffered_bytes() const;
    size_t buffered_messages() const;
    std::chrono::steady_clock::time_point last_flush_time() const;
    const ClientConfig& config() const noexcept;

private:
    Client(ClientConfig config, std::unique_ptr<Transport> transport,
           std::unique_ptr<Codec> codec);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace stitch
