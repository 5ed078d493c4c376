#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/hash.hpp"

#include <cstdint>
#include <string>
#include <tuple>

namespace sendme::store {

/**
 * @brief How the bytes of a blob are to be interpreted
 *
 * Raw blobs are opaque. A HashSeq blob is a concatenation of 32-byte hashes;
 * protecting it from collection also protects every blob it lists.
 */
enum class BlobFormat : std::uint8_t {
    Raw = 0,
    HashSeq = 1
};

inline const char* format_name(BlobFormat format) {
    switch (format) {
        case BlobFormat::Raw: return "raw";
        case BlobFormat::HashSeq: return "hash_seq";
    }
    return "unknown";
}

inline Result<BlobFormat> format_from_byte(std::uint8_t value) {
    switch (value) {
        case 0: return Ok(BlobFormat::Raw);
        case 1: return Ok(BlobFormat::HashSeq);
        default:
            return Err<BlobFormat>(ErrorKind::InvalidArgument,
                                   "unknown blob format " + std::to_string(value));
    }
}

struct HashAndFormat {
    Hash hash;
    BlobFormat format = BlobFormat::Raw;

    bool operator==(const HashAndFormat& other) const noexcept {
        return hash == other.hash && format == other.format;
    }
    bool operator<(const HashAndFormat& other) const noexcept {
        return std::tie(hash, format) < std::tie(other.hash, other.format);
    }
};

/// Import may link the source file into the store instead of copying it.
enum class ImportMode {
    Copy,
    TryReference
};

/**
 * Export may hand the stored blob file over to the destination instead of
 * copying it. The store gives up its copy when it does, and a blob that is
 * still linked from elsewhere is always copied, so every exported file owns
 * its own inode.
 */
enum class ExportMode {
    Copy,
    TryReference
};

} // namespace sendme::store
