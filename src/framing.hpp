// src/framing.hpp
// Newline framing shared by the line-oriented codecs.

#pragma once

#include "stitch/error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stitch {
namespace framing {

inline bool is_space(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

inline void append_line(std::vector<uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
    out.push_back('\n');
}

// Locate the next framed value at or after pos. Returns false when only
// whitespace remains; throws when the trailing value is unterminated.
inline bool next_line(const std::vector<uint8_t>& in, size_t& pos, size_t& begin, size_t& end) {
    while (pos < in.size() && is_space(in[pos])) ++pos;
    if (pos >= in.size()) return false;

    size_t nl = pos;
    while (nl < in.size() && in[nl] != '\n') ++nl;
    if (nl == in.size()) {
        throw StitchError::serialization("truncated value at offset " + std::to_string(pos));
    }
    begin = pos;
    end = nl;
    pos = nl + 1;
    return true;
}

} // namespace framing
} // namespace stitch
