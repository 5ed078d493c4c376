#include "sendme/store/collection.hpp"

#include "sendme/core/wire.hpp"
#include "sendme/store/hash_seq.hpp"

#include <cstring>

namespace sendme::store {
namespace {

constexpr char kMagic[] = "SENDMECL";
constexpr std::size_t kMagicSize = sizeof(kMagic) - 1;

} // namespace

void Collection::push(std::string name, const Hash& hash) {
    entries_.push_back(CollectionEntry{std::move(name), hash});
}

std::vector<std::uint8_t> Collection::encode_metadata() const {
    std::vector<std::uint8_t> buffer;
    wire::write_bytes(buffer, reinterpret_cast<const std::uint8_t*>(kMagic), kMagicSize);
    wire::write_uint8(buffer, kFormatVersion);
    wire::write_uint32(buffer, static_cast<std::uint32_t>(entries_.size()));
    for (const auto& entry : entries_) {
        wire::write_string(buffer, entry.name);
    }
    return buffer;
}

std::vector<std::uint8_t> Collection::encode_root() const {
    std::vector<Hash> hashes;
    hashes.reserve(entries_.size() + 1);
    hashes.push_back(Hash::of(encode_metadata()));
    for (const auto& entry : entries_) {
        hashes.push_back(entry.hash);
    }
    return encode_hash_seq(hashes);
}

Hash Collection::root_hash() const {
    return Hash::of(encode_root());
}

Result<TempTag> Collection::store(Store& store) const {
    auto meta_tag = store.import_bytes(encode_metadata(), BlobFormat::Raw);
    if (meta_tag.is_error()) {
        return meta_tag;
    }
    // The root lists the metadata blob, so it protects it from here on.
    return store.import_bytes(encode_root(), BlobFormat::HashSeq);
}

Result<Collection> Collection::load(const Store& store, const Hash& root) {
    auto root_bytes = store.read_blob(root);
    if (root_bytes.is_error()) {
        return Err<Collection>(ErrorKind::NotFound, "Collection not found: " + root.to_hex());
    }
    auto hashes = parse_hash_seq(root_bytes.value());
    if (hashes.is_error()) {
        return Err<Collection>(hashes.error());
    }
    if (hashes.value().empty()) {
        return Err<Collection>(ErrorKind::Corrupt, "Collection root is empty: " + root.to_hex());
    }
    auto metadata = store.read_blob(hashes.value().front());
    if (metadata.is_error()) {
        return Err<Collection>(ErrorKind::NotFound,
                               "Collection metadata not found: " + hashes.value().front().to_hex());
    }
    return decode(root_bytes.value(), metadata.value());
}

Result<Collection> Collection::decode(const std::vector<std::uint8_t>& root,
                                      const std::vector<std::uint8_t>& metadata) {
    auto hashes = parse_hash_seq(root);
    if (hashes.is_error()) {
        return Err<Collection>(hashes.error());
    }
    if (hashes.value().empty() || hashes.value().front() != Hash::of(metadata)) {
        return Err<Collection>(ErrorKind::Corrupt, "Collection metadata does not match its root");
    }

    if (metadata.size() < kMagicSize || std::memcmp(metadata.data(), kMagic, kMagicSize) != 0) {
        return Err<Collection>(ErrorKind::Corrupt, "Not a collection (bad magic)");
    }
    std::size_t cursor = kMagicSize;

    auto version = wire::read_uint8(metadata, cursor);
    if (version.is_error()) {
        return Err<Collection>(version.error());
    }
    if (version.value() != kFormatVersion) {
        return Err<Collection>(ErrorKind::Corrupt,
                               "Unsupported collection version: " + std::to_string(version.value()));
    }

    auto count = wire::read_uint32(metadata, cursor);
    if (count.is_error()) {
        return Err<Collection>(count.error());
    }
    if (count.value() != hashes.value().size() - 1) {
        return Err<Collection>(ErrorKind::Corrupt,
                               "Collection lists " + std::to_string(count.value()) + " names but " +
                               std::to_string(hashes.value().size() - 1) + " blobs");
    }

    Collection collection;
    for (std::uint32_t i = 0; i < count.value(); ++i) {
        auto name = wire::read_string(metadata, cursor);
        if (name.is_error()) {
            return Err<Collection>(name.error());
        }
        collection.push(std::move(name.value()), hashes.value()[i + 1]);
    }
    if (cursor != metadata.size()) {
        return Err<Collection>(ErrorKind::Corrupt, "Trailing bytes after collection metadata");
    }
    return Ok(std::move(collection));
}

} // namespace sendme::store
