#pragma once

/**
 * @file wire.hpp
 * @brief Big-endian primitives shared by the collection format and the
 *        transfer protocol
 *
 * FORMAT:
 * - Integers: fixed width, network byte order
 * - Strings:  [length: 4 bytes] [bytes: N]
 *
 * Readers take a cursor by reference and advance it only on success, so a
 * failed read leaves the caller free to report where decoding stopped.
 */

#include "sendme/core/result.hpp"

#include <arpa/inet.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace sendme::wire {

inline std::uint64_t swap_to_network(std::uint64_t value) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return __builtin_bswap64(value);
#else
    return value;
#endif
}

inline void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

inline void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    const std::uint32_t network_value = htonl(value);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer.insert(buffer.end(), bytes, bytes + 4);
}

inline void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    const std::uint64_t network_value = swap_to_network(value);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer.insert(buffer.end(), bytes, bytes + 8);
}

inline void write_bytes(std::vector<std::uint8_t>& buffer, const std::uint8_t* data, std::size_t size) {
    buffer.insert(buffer.end(), data, data + size);
}

inline void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
    write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

inline Result<std::uint8_t> read_uint8(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    if (cursor + 1 > buffer.size()) {
        return Err<std::uint8_t>(ErrorKind::Corrupt, "buffer underflow reading uint8");
    }
    const std::uint8_t value = buffer[cursor];
    cursor += 1;
    return Ok(value);
}

inline Result<std::uint32_t> read_uint32(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    if (cursor + 4 > buffer.size()) {
        return Err<std::uint32_t>(ErrorKind::Corrupt, "buffer underflow reading uint32");
    }
    std::uint32_t network_value;
    std::memcpy(&network_value, &buffer[cursor], 4);
    cursor += 4;
    return Ok(static_cast<std::uint32_t>(ntohl(network_value)));
}

inline Result<std::uint64_t> read_uint64(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    if (cursor + 8 > buffer.size()) {
        return Err<std::uint64_t>(ErrorKind::Corrupt, "buffer underflow reading uint64");
    }
    std::uint64_t network_value;
    std::memcpy(&network_value, &buffer[cursor], 8);
    cursor += 8;
    return Ok(swap_to_network(network_value));
}

inline Result<std::string> read_string(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    std::size_t local = cursor;
    auto length_result = read_uint32(buffer, local);
    if (length_result.is_error()) {
        return Err<std::string>(length_result.error());
    }
    const std::uint32_t length = length_result.value();
    if (local + length > buffer.size()) {
        return Err<std::string>(ErrorKind::Corrupt, "buffer underflow reading string");
    }
    std::string value(buffer.begin() + static_cast<std::ptrdiff_t>(local),
                      buffer.begin() + static_cast<std::ptrdiff_t>(local + length));
    cursor = local + length;
    return Ok(value);
}

} // namespace sendme::wire
