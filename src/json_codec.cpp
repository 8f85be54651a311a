// src/json_codec.cpp
// Compact JSON codec, one value per line.

#include "framing.hpp"
#include "stitch/codec.hpp"

namespace stitch {

const std::string& JsonCodec::content_type() const noexcept {
    static const std::string type = "application/json";
    return type;
}

void JsonCodec::encode(const nlohmann::json& value, std::vector<uint8_t>& out) const {
    std::string text;
    try {
        text = value.dump();
    } catch (const nlohmann::json::exception& e) {
        throw StitchError::serialization(e.what());
    }
    framing::append_line(out, text);
}

bool JsonCodec::decode(const std::vector<uint8_t>& in, size_t& pos, nlohmann::json& out) const {
    size_t begin = 0, end = 0;
    if (!framing::next_line(in, pos, begin, end)) return false;
    try {
        out = nlohmann::json::parse(in.begin() + static_cast<std::ptrdiff_t>(begin),
                                    in.begin() + static_cast<std::ptrdiff_t>(end));
    } catch (const nlohmann::json::parse_error& e) {
        throw StitchError::serialization("corrupted value at offset " +
                                         std::to_string(begin) + ": " + e.what());
    }
    return true;
}

std::unique_ptr<Codec> make_codec(WireFormat format) {
    switch (format) {
        case WireFormat::Json:        return std::make_unique<JsonCodec>();
        case WireFormat::TransitJson: return std::make_unique<TransitJsonCodec>();
    }
    return std::make_unique<TransitJsonCodec>();
}

} // namespace stitch
