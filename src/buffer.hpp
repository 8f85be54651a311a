// src/buffer.hpp
// Encoded-message accumulator and the flush triggers.

#pragma once

#include "stitch/codec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <vector>

namespace stitch {

// Append-only byte buffer of independently encoded values.
//
// Size only grows between resets. last_flush() starts at the construction
// time and moves only through reset().
class Buffer {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit Buffer(TimePoint created) : last_flush_(created) {}

    // Encode value and append it. On failure nothing is appended.
    void append(const Codec& codec, const nlohmann::json& value);

    // Decode every buffered value, in push order. Throws Serialization when
    // the bytes do not decode back into exactly count() values.
    std::vector<nlohmann::json> decode_all(const Codec& codec) const;

    // Drop all bytes and record a successful flush.
    void reset(TimePoint flushed_at);

    bool empty() const noexcept { return bytes_.empty(); }
    size_t size() const noexcept { return bytes_.size(); }
    size_t count() const noexcept { return count_; }
    TimePoint last_flush() const noexcept { return last_flush_; }
    const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
    size_t count_ = 0;
    TimePoint last_flush_;
};

// Size and age triggers, both inclusive.
struct FlushPolicy {
    size_t buffer_size = 0;
    std::chrono::milliseconds flush_interval{0};

    bool should_flush(const Buffer& buffer, Buffer::TimePoint now) const {
        return buffer.size() >= buffer_size || (now - buffer.last_flush()) >= flush_interval;
    }
};

} // namespace stitch
