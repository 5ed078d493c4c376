#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/hash.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace sendme::store {

inline std::vector<std::uint8_t> encode_hash_seq(const std::vector<Hash>& hashes) {
    std::vector<std::uint8_t> out;
    out.reserve(hashes.size() * Hash::kSize);
    for (const auto& hash : hashes) {
        out.insert(out.end(), hash.bytes().begin(), hash.bytes().end());
    }
    return out;
}

inline Result<std::vector<Hash>> parse_hash_seq(const std::vector<std::uint8_t>& data) {
    if (data.size() % Hash::kSize != 0) {
        return Err<std::vector<Hash>>(ErrorKind::Corrupt,
                                      "hash sequence length " + std::to_string(data.size()) +
                                      " is not a multiple of " + std::to_string(Hash::kSize));
    }
    std::vector<Hash> hashes;
    hashes.reserve(data.size() / Hash::kSize);
    for (std::size_t offset = 0; offset < data.size(); offset += Hash::kSize) {
        Hash::Bytes bytes{};
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset),
                  data.begin() + static_cast<std::ptrdiff_t>(offset + Hash::kSize),
                  bytes.begin());
        hashes.emplace_back(bytes);
    }
    return Ok(hashes);
}

} // namespace sendme::store
