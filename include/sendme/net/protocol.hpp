#pragma once

/**
 * @file protocol.hpp
 * @brief Framing of the provider/getter conversation over TCP
 *
 * FORMAT (all integers big-endian):
 *
 * Hello, provider -> getter, once per connection:
 *   [magic: "SNDM"] [version: 1 byte] [node id: 32 bytes]
 *
 * Request, getter -> provider, any number per connection:
 *   [kind: 1 byte] [hash: 32 bytes] [format: 1 byte]
 *
 * Response:
 *   [status: 1 byte]
 *   sizes: [count: 4 bytes] [size: 8 bytes] * count
 *   get:   one frame per blob, [length: 8 bytes] [bytes: length]
 *          (a HashSeq root is sent first, followed by its children in order)
 */

#include "sendme/core/result.hpp"
#include "sendme/net/secret_key.hpp"
#include "sendme/store/hash.hpp"
#include "sendme/store/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sendme::net {

inline constexpr std::array<std::uint8_t, 4> kHelloMagic{'S', 'N', 'D', 'M'};
inline constexpr std::uint8_t kProtocolVersion = 1;
inline constexpr std::size_t kHelloSize = kHelloMagic.size() + 1 + store::Hash::kSize;
inline constexpr std::size_t kRequestSize = 1 + store::Hash::kSize + 1;
inline constexpr std::size_t kFrameHeaderSize = 8;
inline constexpr std::size_t kChunkSize = 64 * 1024;

// Upper bound on a HashSeq root the getter is willing to buffer in memory.
inline constexpr std::uint64_t kMaxHashSeqSize = 32ULL * 1024 * 1024;
inline constexpr std::uint32_t kMaxSizesCount = static_cast<std::uint32_t>(kMaxHashSeqSize / store::Hash::kSize);

enum class RequestKind : std::uint8_t {
    Sizes = 1,
    Get = 2
};

enum class ResponseStatus : std::uint8_t {
    Ok = 0,
    NotFound = 1,
    BadRequest = 2
};

const char* status_name(ResponseStatus status);

struct Request {
    RequestKind kind = RequestKind::Get;
    store::HashAndFormat content;
};

std::vector<std::uint8_t> encode_hello(const NodeId& node_id);
Result<NodeId> decode_hello(const std::vector<std::uint8_t>& buffer);

std::vector<std::uint8_t> encode_request(const Request& request);
Result<Request> decode_request(const std::vector<std::uint8_t>& buffer);

Result<ResponseStatus> decode_status(std::uint8_t value);

/// Body of a successful sizes reply (the status byte is not included).
std::vector<std::uint8_t> encode_sizes(const std::vector<std::uint64_t>& sizes);

std::vector<std::uint8_t> encode_frame_header(std::uint64_t length);

} // namespace sendme::net
