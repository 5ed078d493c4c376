#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/hash.hpp"
#include "sendme/store/store.hpp"
#include "sendme/store/temp_tag.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sendme::store {

struct CollectionEntry {
    std::string name; ///< '/'-separated relative name
    Hash hash;

    bool operator==(const CollectionEntry& other) const {
        return name == other.name && hash == other.hash;
    }
};

/**
 * @brief Ordered list of named blobs representing a file or directory tree
 *
 * STORED FORM:
 * A collection occupies two blobs. The metadata blob holds the names:
 *   [magic "SENDMECL": 8 bytes] [version: 1 byte] [count: 4 bytes]
 *   count x [name_length: 4 bytes] [name: N bytes]
 * The root blob is a HashSeq [meta_hash, hash_1, ..., hash_n]; its hash
 * identifies the collection. Both are pure functions of the entry sequence,
 * so equal sequences give byte-identical blobs.
 */
class Collection {
public:
    static constexpr std::uint8_t kFormatVersion = 1;

    Collection() = default;

    void push(std::string name, const Hash& hash);

    [[nodiscard]] const std::vector<CollectionEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    std::vector<CollectionEntry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<CollectionEntry>::const_iterator end() const { return entries_.end(); }

    [[nodiscard]] std::vector<std::uint8_t> encode_metadata() const;
    [[nodiscard]] std::vector<std::uint8_t> encode_root() const;

    /// Hash the collection would be stored under.
    [[nodiscard]] Hash root_hash() const;

    /**
     * Persist metadata and root blobs. The returned tag protects the root
     * and, through it, every member blob.
     */
    Result<TempTag> store(Store& store) const;

    static Result<Collection> load(const Store& store, const Hash& root);

    static Result<Collection> decode(const std::vector<std::uint8_t>& root,
                                     const std::vector<std::uint8_t>& metadata);

    bool operator==(const Collection& other) const { return entries_ == other.entries_; }

private:
    std::vector<CollectionEntry> entries_;
};

} // namespace sendme::store
