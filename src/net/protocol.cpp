#include "sendme/net/protocol.hpp"

#include "sendme/core/wire.hpp"

#include <algorithm>

namespace sendme::net {

const char* status_name(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::Ok: return "ok";
        case ResponseStatus::NotFound: return "not found";
        case ResponseStatus::BadRequest: return "bad request";
    }
    return "unknown";
}

std::vector<std::uint8_t> encode_hello(const NodeId& node_id) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(kHelloSize);
    wire::write_bytes(buffer, kHelloMagic.data(), kHelloMagic.size());
    wire::write_uint8(buffer, kProtocolVersion);
    wire::write_bytes(buffer, node_id.bytes().data(), node_id.bytes().size());
    return buffer;
}

Result<NodeId> decode_hello(const std::vector<std::uint8_t>& buffer) {
    if (buffer.size() != kHelloSize) {
        return Err<NodeId>(ErrorKind::ProtocolViolation, "hello frame has wrong size");
    }
    if (!std::equal(kHelloMagic.begin(), kHelloMagic.end(), buffer.begin())) {
        return Err<NodeId>(ErrorKind::ProtocolViolation, "peer is not a sendme provider");
    }

    std::size_t cursor = kHelloMagic.size();
    auto version = wire::read_uint8(buffer, cursor);
    if (version.is_error()) {
        return Err<NodeId>(version.error());
    }
    if (version.value() != kProtocolVersion) {
        return Err<NodeId>(ErrorKind::ProtocolViolation,
                           "unsupported protocol version " + std::to_string(version.value()));
    }

    store::Hash::Bytes bytes{};
    std::copy(buffer.begin() + static_cast<std::ptrdiff_t>(cursor), buffer.end(), bytes.begin());
    return Ok(NodeId(bytes));
}

std::vector<std::uint8_t> encode_request(const Request& request) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(kRequestSize);
    wire::write_uint8(buffer, static_cast<std::uint8_t>(request.kind));
    const auto& hash = request.content.hash.bytes();
    wire::write_bytes(buffer, hash.data(), hash.size());
    wire::write_uint8(buffer, static_cast<std::uint8_t>(request.content.format));
    return buffer;
}

Result<Request> decode_request(const std::vector<std::uint8_t>& buffer) {
    if (buffer.size() != kRequestSize) {
        return Err<Request>(ErrorKind::ProtocolViolation, "request has wrong size");
    }

    Request request;
    const std::uint8_t kind = buffer[0];
    if (kind == static_cast<std::uint8_t>(RequestKind::Sizes)) {
        request.kind = RequestKind::Sizes;
    } else if (kind == static_cast<std::uint8_t>(RequestKind::Get)) {
        request.kind = RequestKind::Get;
    } else {
        return Err<Request>(ErrorKind::ProtocolViolation, "unknown request kind " + std::to_string(kind));
    }

    store::Hash::Bytes bytes{};
    std::copy(buffer.begin() + 1, buffer.begin() + 1 + store::Hash::kSize, bytes.begin());

    auto format = store::format_from_byte(buffer[kRequestSize - 1]);
    if (format.is_error()) {
        return Err<Request>(ErrorKind::ProtocolViolation, format.error().message);
    }

    request.content = store::HashAndFormat{store::Hash(bytes), format.value()};
    return Ok(request);
}

Result<ResponseStatus> decode_status(std::uint8_t value) {
    switch (value) {
        case 0: return Ok(ResponseStatus::Ok);
        case 1: return Ok(ResponseStatus::NotFound);
        case 2: return Ok(ResponseStatus::BadRequest);
        default:
            return Err<ResponseStatus>(ErrorKind::ProtocolViolation,
                                       "unknown response status " + std::to_string(value));
    }
}

std::vector<std::uint8_t> encode_sizes(const std::vector<std::uint64_t>& sizes) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(4 + (sizes.size() * 8));
    wire::write_uint32(buffer, static_cast<std::uint32_t>(sizes.size()));
    for (auto size : sizes) {
        wire::write_uint64(buffer, size);
    }
    return buffer;
}

std::vector<std::uint8_t> encode_frame_header(std::uint64_t length) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(kFrameHeaderSize);
    wire::write_uint64(buffer, length);
    return buffer;
}

} // namespace sendme::net
