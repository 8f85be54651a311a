// src/buffer.cpp

#include "buffer.hpp"

#include "stitch/error.hpp"

namespace stitch {

void Buffer::append(const Codec& codec, const nlohmann::json& value) {
    size_t mark = bytes_.size();
    try {
        codec.encode(value, bytes_);
    } catch (const StitchError&) {
        bytes_.resize(mark);
        throw;
    }
    count_++;
}

std::vector<nlohmann::json> Buffer::decode_all(const Codec& codec) const {
    std::vector<nlohmann::json> values;
    values.reserve(count_);

    size_t pos = 0;
    nlohmann::json value;
    while (codec.decode(bytes_, pos, value)) {
        values.push_back(std::move(value));
    }

    if (values.size() != count_) {
        throw StitchError::serialization("buffer holds " + std::to_string(values.size()) +
                                         " values, expected " + std::to_string(count_));
    }
    return values;
}

void Buffer::reset(TimePoint flushed_at) {
    bytes_.clear();
    count_ = 0;
    last_flush_ = flushed_at;
}

} // namespace stitch
