// src/transit_codec.cpp
// Transit over JSON, non-verbose write mode, one value per line.
//
// Maps are written as ["^ ", k1, v1, ...]. Strings that begin with one of
// the transit marker characters are escaped with '~'. Integers that JSON
// readers cannot hold exactly become "~i<digits>". The writer never emits
// cache references.

#include "framing.hpp"
#include "stitch/codec.hpp"

#include <charconv>
#include <cstdint>
#include <string>

namespace stitch {

namespace {

constexpr const char* MAP_MARKER = "^ ";
constexpr const char* QUOTE_TAG = "~#'";
constexpr int64_t MAX_JSON_INT = (int64_t(1) << 53) - 1;

bool is_marker(char c) {
    return c == '~' || c == '^' || c == '`';
}

std::string escape(const std::string& s) {
    if (!s.empty() && is_marker(s[0])) return "~" + s;
    return s;
}

template <typename T>
nlohmann::json parse_integer(const std::string& digits) {
    T value{};
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec != std::errc() || res.ptr != digits.data() + digits.size()) {
        throw StitchError::serialization("invalid transit integer: " + digits);
    }
    return value;
}

nlohmann::json decode_integer(const std::string& digits) {
    if (!digits.empty() && digits[0] == '-') return parse_integer<int64_t>(digits);
    return parse_integer<uint64_t>(digits);
}

nlohmann::json decode_string(const std::string& s) {
    if (s.empty()) return s;
    if (s[0] == '^') {
        throw StitchError::serialization("transit cache references are not supported: " + s);
    }
    if (s[0] != '~' || s.size() < 2) return s;

    char tag = s[1];
    std::string rest = s.substr(2);
    switch (tag) {
        case '~':
        case '^':
        case '`':
            return s.substr(1);
        case 'i':
        case 'n':
            return decode_integer(rest);
        case 'd':
            try {
                return std::stod(rest);
            } catch (const std::exception&) {
                throw StitchError::serialization("invalid transit double: " + rest);
            }
        case '?':
            if (rest == "t") return true;
            if (rest == "f") return false;
            throw StitchError::serialization("invalid transit boolean: " + s);
        case '_':
            return nullptr;
        case ':':
        case '$':
            return rest;
        default:
            throw StitchError::serialization("unsupported transit tag: " + s);
    }
}

} // namespace

nlohmann::json TransitJsonCodec::to_transit(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object: {
            auto out = nlohmann::json::array({MAP_MARKER});
            for (const auto& item : value.items()) {
                out.push_back(escape(item.key()));
                out.push_back(to_transit(item.value()));
            }
            return out;
        }
        case nlohmann::json::value_t::array: {
            auto out = nlohmann::json::array();
            for (const auto& element : value) out.push_back(to_transit(element));
            return out;
        }
        case nlohmann::json::value_t::string:
            return escape(value.get_ref<const std::string&>());
        case nlohmann::json::value_t::number_integer: {
            auto n = value.get<int64_t>();
            if (n > MAX_JSON_INT || n < -MAX_JSON_INT) return "~i" + std::to_string(n);
            return value;
        }
        case nlohmann::json::value_t::number_unsigned: {
            auto n = value.get<uint64_t>();
            if (n > static_cast<uint64_t>(MAX_JSON_INT)) return "~i" + std::to_string(n);
            return value;
        }
        case nlohmann::json::value_t::binary:
            throw StitchError::serialization("binary values cannot be written as transit");
        default:
            return value;
    }
}

nlohmann::json TransitJsonCodec::from_transit(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::array: {
            if (!value.empty() && value[0].is_string()) {
                const auto& head = value[0].get_ref<const std::string&>();
                if (head == MAP_MARKER) {
                    if (value.size() % 2 != 1) {
                        throw StitchError::serialization("transit map has an odd number of entries");
                    }
                    auto out = nlohmann::json::object();
                    for (size_t i = 1; i < value.size(); i += 2) {
                        if (!value[i].is_string()) {
                            throw StitchError::serialization("transit map key is not a string");
                        }
                        auto key = decode_string(value[i].get_ref<const std::string&>());
                        if (!key.is_string()) {
                            throw StitchError::serialization("transit map key is not a string");
                        }
                        out[key.get<std::string>()] = from_transit(value[i + 1]);
                    }
                    return out;
                }
                if (head == QUOTE_TAG && value.size() == 2) {
                    return from_transit(value[1]);
                }
                if (head.rfind("~#", 0) == 0) {
                    throw StitchError::serialization("unsupported transit tag: " + head);
                }
            }
            auto out = nlohmann::json::array();
            for (const auto& element : value) out.push_back(from_transit(element));
            return out;
        }
        case nlohmann::json::value_t::object: {
            // Verbose-mode map.
            auto out = nlohmann::json::object();
            for (const auto& item : value.items()) {
                auto key = decode_string(item.key());
                if (!key.is_string()) {
                    throw StitchError::serialization("transit map key is not a string");
                }
                out[key.get<std::string>()] = from_transit(item.value());
            }
            return out;
        }
        case nlohmann::json::value_t::string:
            return decode_string(value.get_ref<const std::string&>());
        default:
            return value;
    }
}

const std::string& TransitJsonCodec::content_type() const noexcept {
    static const std::string type = "application/transit+json";
    return type;
}

void TransitJsonCodec::encode(const nlohmann::json& value, std::vector<uint8_t>& out) const {
    auto transit = to_transit(value);
    if (!value.is_object() && !value.is_array()) {
        transit = nlohmann::json::array({QUOTE_TAG, transit});
    }
    std::string text;
    try {
        text = transit.dump();
    } catch (const nlohmann::json::exception& e) {
        throw StitchError::serialization(e.what());
    }
    framing::append_line(out, text);
}

bool TransitJsonCodec::decode(const std::vector<uint8_t>& in, size_t& pos,
                              nlohmann::json& out) const {
    size_t begin = 0, end = 0;
    if (!framing::next_line(in, pos, begin, end)) return false;
    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(in.begin() + static_cast<std::ptrdiff_t>(begin),
                                    in.begin() + static_cast<std::ptrdiff_t>(end));
    } catch (const nlohmann::json::parse_error& e) {
        throw StitchError::serialization("corrupted value at offset " +
                                         std::to_string(begin) + ": " + e.what());
    }
    out = from_transit(raw);
    return true;
}

} // namespace stitch
