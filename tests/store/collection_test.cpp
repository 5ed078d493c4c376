#include "sendme/store/collection.hpp"
#include "sendme/store/fs_store.hpp"
#include "sendme/store/hash_seq.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using sendme::ErrorKind;
using namespace sendme::store;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("sendme_collection_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

Hash hash_of(const std::string& text) {
    return Hash::of(std::vector<uint8_t>(text.begin(), text.end()));
}

Collection sample_collection() {
    Collection collection;
    collection.push("photos/a.jpg", hash_of("a"));
    collection.push("photos/b.jpg", hash_of("b"));
    collection.push("readme.txt", hash_of("readme"));
    return collection;
}

} // namespace

TEST(CollectionTest, EncodingIsDeterministic) {
    EXPECT_EQ(sample_collection().encode_metadata(), sample_collection().encode_metadata());
    EXPECT_EQ(sample_collection().root_hash(), sample_collection().root_hash());

    Collection reordered;
    reordered.push("photos/b.jpg", hash_of("b"));
    reordered.push("photos/a.jpg", hash_of("a"));
    reordered.push("readme.txt", hash_of("readme"));
    EXPECT_NE(reordered.root_hash(), sample_collection().root_hash());
}

TEST(CollectionTest, RootListsMetadataFirst) {
    const auto collection = sample_collection();
    auto hashes = parse_hash_seq(collection.encode_root());
    ASSERT_TRUE(hashes.is_ok());
    ASSERT_EQ(hashes.value().size(), 4u);
    EXPECT_EQ(hashes.value()[0], Hash::of(collection.encode_metadata()));
    EXPECT_EQ(hashes.value()[1], hash_of("a"));
    EXPECT_EQ(hashes.value()[3], hash_of("readme"));
}

TEST(CollectionTest, DecodeRestoresEntries) {
    const auto collection = sample_collection();
    auto decoded = Collection::decode(collection.encode_root(), collection.encode_metadata());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), collection);
}

TEST(CollectionTest, DecodeRejectsMismatchedMetadata) {
    const auto collection = sample_collection();

    Collection other;
    other.push("only.txt", hash_of("x"));

    auto decoded = Collection::decode(collection.encode_root(), other.encode_metadata());
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Corrupt);
}

TEST(CollectionTest, DecodeRejectsTrailingBytes) {
    const auto collection = sample_collection();
    auto metadata = collection.encode_metadata();
    metadata.push_back(0);

    // rebuild a root that points at the tampered metadata
    std::vector<Hash> hashes{Hash::of(metadata)};
    for (const auto& entry : collection) {
        hashes.push_back(entry.hash);
    }

    auto decoded = Collection::decode(encode_hash_seq(hashes), metadata);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Corrupt);
}

TEST(CollectionTest, StoreAndLoad) {
    const auto dir = create_temp_dir();
    auto store = FsStore::open(dir);
    ASSERT_TRUE(store.is_ok());

    const auto collection = sample_collection();
    auto tag = collection.store(*store.value());
    ASSERT_TRUE(tag.is_ok());
    EXPECT_EQ(tag.value().hash(), collection.root_hash());
    EXPECT_EQ(tag.value().format(), BlobFormat::HashSeq);

    auto loaded = Collection::load(*store.value(), tag.value().hash());
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value(), collection);

    // metadata blob survives gc through the root tag
    EXPECT_EQ(store.value()->gc(), 0u);

    auto missing = Collection::load(*store.value(), hash_of("nothing"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    store.value().reset();
    fs::remove_all(dir);
}

TEST(CollectionTest, EmptyCollectionRoundTrips) {
    Collection empty;
    auto decoded = Collection::decode(empty.encode_root(), empty.encode_metadata());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_TRUE(decoded.value().empty());
}
