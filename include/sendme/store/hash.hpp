#pragma once

#include "sendme/core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace sendme::store {

/**
 * @brief SHA-256 content identity of a blob
 */
class Hash {
public:
    static constexpr std::size_t kSize = 32;
    using Bytes = std::array<std::uint8_t, kSize>;

    Hash() : bytes_{} {}
    explicit Hash(const Bytes& bytes) : bytes_(bytes) {}

    static Hash of(const std::uint8_t* data, std::size_t size);
    static Hash of(const std::vector<std::uint8_t>& data) { return of(data.data(), data.size()); }

    /**
     * Parse a 64-character hex string (either case).
     */
    static Result<Hash> from_hex(std::string_view text);

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

    bool operator==(const Hash& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Hash& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Hash& other) const noexcept { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

/**
 * @brief Incremental SHA-256 over a stream of buffers
 */
class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(const void* data, std::size_t size);
    Hash finalize();

private:
    evp_md_ctx_st* ctx_;
};

} // namespace sendme::store

namespace std {
template<>
struct hash<sendme::store::Hash> {
    std::size_t operator()(const sendme::store::Hash& h) const noexcept {
        std::size_t value = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            value = (value << 8) | h.bytes()[i];
        }
        return value;
    }
};
} // namespace std
