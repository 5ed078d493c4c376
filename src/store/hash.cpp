#include "sendme/store/hash.hpp"

#include "sendme/core/hex.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace sendme::store {

Hash Hash::of(const std::uint8_t* data, std::size_t size) {
    Hasher hasher;
    hasher.update(data, size);
    return hasher.finalize();
}

Result<Hash> Hash::from_hex(std::string_view text) {
    if (text.size() != kSize * 2) {
        return Err<Hash>(ErrorKind::InvalidArgument,
                         "hash must be " + std::to_string(kSize * 2) + " hex characters");
    }
    auto decoded = hex::decode(text);
    if (decoded.is_error()) {
        return Err<Hash>(ErrorKind::InvalidArgument, "invalid hash " + std::string(text));
    }
    Bytes bytes{};
    std::copy(decoded.value().begin(), decoded.value().end(), bytes.begin());
    return Ok(Hash(bytes));
}

std::string Hash::to_hex() const {
    return hex::encode(bytes_.data(), bytes_.size());
}

Hasher::Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
    }
}

Hasher::~Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Hasher::update(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Hash Hasher::finalize() {
    Hash::Bytes out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return Hash(out);
}

} // namespace sendme::store
