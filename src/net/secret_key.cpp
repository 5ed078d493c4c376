#include "sendme/net/secret_key.hpp"

#include "sendme/core/hex.hpp"

#include <openssl/rand.h>

#include <algorithm>

namespace sendme::net {

Result<SecretKey> SecretKey::generate() {
    Bytes bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Err<SecretKey>(ErrorKind::Io, "failed to gather randomness for secret key");
    }
    return Ok(SecretKey(bytes));
}

Result<SecretKey> SecretKey::from_hex(std::string_view text) {
    if (text.size() != kSize * 2) {
        return Err<SecretKey>(ErrorKind::InvalidArgument,
                              "secret key must be " + std::to_string(kSize * 2) + " hex characters");
    }
    auto decoded = hex::decode(text);
    if (decoded.is_error()) {
        return Err<SecretKey>(ErrorKind::InvalidArgument, "secret key: " + decoded.error().message);
    }
    Bytes bytes{};
    std::copy(decoded.value().begin(), decoded.value().end(), bytes.begin());
    return Ok(SecretKey(bytes));
}

std::string SecretKey::to_hex() const {
    return hex::encode(bytes_.data(), bytes_.size());
}

NodeId SecretKey::node_id() const {
    return store::Hash::of(bytes_.data(), bytes_.size());
}

} // namespace sendme::net
