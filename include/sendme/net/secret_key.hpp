#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/hash.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace sendme::net {

/// Public identity of a provider, announced in its hello frame.
using NodeId = store::Hash;

/**
 * @brief 32-byte node secret
 *
 * The node id is the SHA-256 of the secret bytes. Keys are passed
 * explicitly into the provider and getter; nothing is kept globally.
 */
class SecretKey {
public:
    static constexpr std::size_t kSize = 32;
    using Bytes = std::array<std::uint8_t, kSize>;

    /// Fresh key from OpenSSL's CSPRNG.
    static Result<SecretKey> generate();

    /// Parse the 64-character hex form (as stored in SENDME_SECRET).
    static Result<SecretKey> from_hex(std::string_view text);

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] NodeId node_id() const;
    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

private:
    explicit SecretKey(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_;
};

} // namespace sendme::net
