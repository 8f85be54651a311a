// include/stitch/codec.hpp
// Encode/decode pair used for the buffer and the batch body.

#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stitch {

// Structured-value codec.
//
// The buffer holds values written back to back by encode(). decode() reads
// them one at a time; reaching the end of the bytes after a whole value is
// the normal end of the stream. All failures throw StitchError of kind
// Serialization.
class Codec {
public:
    virtual ~Codec() = default;

    // Media type sent as Content-Type.
    virtual const std::string& content_type() const noexcept = 0;

    // Append one encoded value to out.
    virtual void encode(const nlohmann::json& value, std::vector<uint8_t>& out) const = 0;

    // Decode the value starting at pos and advance pos past it.
    // Returns false when only whitespace remains.
    virtual bool decode(const std::vector<uint8_t>& in, size_t& pos,
                        nlohmann::json& out) const = 0;

    // Append one document holding all values as an array.
    virtual void encode_batch(const std::vector<nlohmann::json>& values,
                              std::vector<uint8_t>& out) const {
        encode(nlohmann::json(values), out);
    }
};

// Compact JSON, one value per line.
class JsonCodec : public Codec {
public:
    const std::string& content_type() const noexcept override;
    void encode(const nlohmann::json& value, std::vector<uint8_t>& out) const override;
    bool decode(const std::vector<uint8_t>& in, size_t& pos,
                nlohmann::json& out) const override;
};

// Transit over JSON (non-verbose), one value per line.
class TransitJsonCodec : public Codec {
public:
    const std::string& content_type() const noexcept override;
    void encode(const nlohmann::json& value, std::vector<uint8_t>& out) const override;
    bool decode(const std::vector<uint8_t>& in, size_t& pos,
                nlohmann::json& out) const override;

    // Transit form of a plain value and back (no framing).
    static nlohmann::json to_transit(const nlohmann::json& value);
    static nlohmann::json from_transit(const nlohmann::json& value);
};

std::unique_ptr<Codec> make_codec(WireFormat format);

} // namespace stitch
