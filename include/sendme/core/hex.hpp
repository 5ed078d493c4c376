#pragma once

#include "sendme/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sendme::hex {

inline std::string encode(const std::uint8_t* data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.resize(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out[(2 * i) + 0] = kDigits[(data[i] >> 4) & 0xF];
        out[(2 * i) + 1] = kDigits[data[i] & 0xF];
    }
    return out;
}

inline std::string encode(std::string_view text) {
    return encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

inline int nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

/**
 * Decode hex of either case. Odd lengths and non-hex characters are
 * InvalidArgument.
 */
inline Result<std::vector<std::uint8_t>> decode(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument, "odd number of hex digits");
    }
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = nibble(text[i]);
        const int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument,
                                                  "invalid hex digit at offset " + std::to_string(i));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return Ok(std::move(out));
}

} // namespace sendme::hex
