#include "sendme/store/fs_store.hpp"
#include "sendme/store/hash_seq.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
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
    fs::path dir = base / fs::path("sendme_store_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::size_t count_files(const fs::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

} // namespace

class BlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir();
        auto opened = FsStore::open(dir_ / "store");
        ASSERT_TRUE(opened.is_ok());
        store_ = std::move(opened.value());
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::unique_ptr<FsStore> store_;
};

TEST(HashTest, KnownSha256Vectors) {
    EXPECT_EQ(Hash::of(bytes_of("")).to_hex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Hash::of(bytes_of("abc")).to_hex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashTest, HexParsing) {
    const auto hash = Hash::of(bytes_of("hello"));

    auto parsed = Hash::from_hex(hash.to_hex());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), hash);

    EXPECT_TRUE(Hash::from_hex("abc").is_error());
    EXPECT_TRUE(Hash::from_hex(std::string(64, 'z')).is_error());
}

TEST(HashTest, IncrementalMatchesOneShot) {
    Hasher hasher;
    hasher.update("hello ", 6);
    hasher.update("world", 5);
    EXPECT_EQ(hasher.finalize(), Hash::of(bytes_of("hello world")));
}

TEST_F(BlobStoreTest, ImportFileCopiesAndHashes) {
    const auto source = dir_ / "input.txt";
    write_file(source, "some file content");

    auto imported = store_->import_file(source, ImportMode::Copy);
    ASSERT_TRUE(imported.is_ok());
    EXPECT_EQ(imported.value().size, 17u);
    EXPECT_EQ(imported.value().tag.hash(), Hash::of(bytes_of("some file content")));
    EXPECT_TRUE(store_->contains(imported.value().tag.hash()));

    auto data = store_->read_blob(imported.value().tag.hash());
    ASSERT_TRUE(data.is_ok());
    EXPECT_EQ(data.value(), bytes_of("some file content"));

    // nothing left behind in the staging area
    EXPECT_EQ(count_files(dir_ / "store" / "tmp"), 0u);
}

TEST_F(BlobStoreTest, ImportByReferenceLeavesSourceIntact) {
    const auto source = dir_ / "linked.bin";
    write_file(source, "linked content");

    auto imported = store_->import_file(source, ImportMode::TryReference);
    ASSERT_TRUE(imported.is_ok());
    EXPECT_EQ(read_file(source), "linked content");

    auto size = store_->blob_size(imported.value().tag.hash());
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value(), 14u);
}

TEST_F(BlobStoreTest, ImportMissingFileIsNotFound) {
    auto imported = store_->import_file(dir_ / "missing", ImportMode::Copy);
    ASSERT_TRUE(imported.is_error());
    EXPECT_EQ(imported.error().kind, ErrorKind::NotFound);
}

TEST_F(BlobStoreTest, WriterVerifiesHashOnCommit) {
    auto writer = store_->begin_write();
    ASSERT_TRUE(writer.is_ok());
    ASSERT_TRUE(writer.value()->write(reinterpret_cast<const uint8_t*>("abc"), 3).is_ok());
    EXPECT_EQ(writer.value()->bytes_written(), 3u);

    auto committed = writer.value()->commit(Hash::of(bytes_of("xyz")), BlobFormat::Raw);
    ASSERT_TRUE(committed.is_error());
    EXPECT_EQ(committed.error().kind, ErrorKind::Corrupt);
    EXPECT_FALSE(store_->contains(Hash::of(bytes_of("abc"))));

    writer.value().reset();
    EXPECT_EQ(count_files(dir_ / "store" / "tmp"), 0u);
}

TEST_F(BlobStoreTest, AbandonedWriterDiscardsStagedBytes) {
    {
        auto writer = store_->begin_write();
        ASSERT_TRUE(writer.is_ok());
        ASSERT_TRUE(writer.value()->write(reinterpret_cast<const uint8_t*>("partial"), 7).is_ok());
    }
    EXPECT_EQ(count_files(dir_ / "store" / "tmp"), 0u);
    EXPECT_EQ(count_files(dir_ / "store" / "blobs"), 0u);
}

TEST_F(BlobStoreTest, ExportRefusesToOverwrite) {
    auto tag = store_->import_bytes(bytes_of("payload"), BlobFormat::Raw);
    ASSERT_TRUE(tag.is_ok());

    const auto target = dir_ / "out" / "nested" / "file.txt";
    ASSERT_TRUE(store_->export_blob(tag.value().hash(), target, ExportMode::Copy).is_ok());
    EXPECT_EQ(read_file(target), "payload");

    auto again = store_->export_blob(tag.value().hash(), target, ExportMode::TryReference);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::ExportFailed);
}

TEST_F(BlobStoreTest, ReferenceExportMovesBlobOutOfStore) {
    auto tag = store_->import_bytes(bytes_of("handed over"), BlobFormat::Raw);
    ASSERT_TRUE(tag.is_ok());
    const auto hash = tag.value().hash();

    const auto first = dir_ / "out" / "first.txt";
    ASSERT_TRUE(store_->export_blob(hash, first, ExportMode::TryReference).is_ok());
    EXPECT_EQ(read_file(first), "handed over");
    EXPECT_EQ(fs::hard_link_count(first), 1u);
    EXPECT_FALSE(store_->contains(hash));

    // a repeat export copies from the first destination
    const auto second = dir_ / "out" / "second.txt";
    ASSERT_TRUE(store_->export_blob(hash, second, ExportMode::TryReference).is_ok());
    EXPECT_EQ(fs::hard_link_count(second), 1u);

    write_file(second, "changed");
    EXPECT_EQ(read_file(first), "handed over");
}

TEST_F(BlobStoreTest, ReferenceExportCopiesBlobLinkedFromSource) {
    const auto source = dir_ / "original.txt";
    write_file(source, "user data");
    auto imported = store_->import_file(source, ImportMode::TryReference);
    ASSERT_TRUE(imported.is_ok());
    const auto hash = imported.value().tag.hash();

    const auto target = dir_ / "out" / "copy.txt";
    ASSERT_TRUE(store_->export_blob(hash, target, ExportMode::TryReference).is_ok());
    EXPECT_TRUE(store_->contains(hash));

    write_file(target, "scribbled");
    EXPECT_EQ(read_file(source), "user data");
    auto stored = store_->read_blob(hash);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(Hash::of(stored.value()), hash);
}

TEST_F(BlobStoreTest, ExportUnknownBlobIsNotFound) {
    auto result = store_->export_blob(Hash::of(bytes_of("never stored")), dir_ / "x", ExportMode::Copy);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(BlobStoreTest, GcKeepsTaggedBlobsAndHashSeqChildren) {
    auto a = store_->import_bytes(bytes_of("a"), BlobFormat::Raw);
    auto b = store_->import_bytes(bytes_of("b"), BlobFormat::Raw);
    auto loose = store_->import_bytes(bytes_of("loose"), BlobFormat::Raw);
    ASSERT_TRUE(a.is_ok() && b.is_ok() && loose.is_ok());

    auto seq = store_->import_bytes(encode_hash_seq({a.value().hash(), b.value().hash()}), BlobFormat::HashSeq);
    ASSERT_TRUE(seq.is_ok());

    const auto loose_hash = loose.value().hash();
    a.value().release();
    b.value().release();
    loose.value().release();

    EXPECT_EQ(store_->gc(), 1u);
    EXPECT_FALSE(store_->contains(loose_hash));
    EXPECT_TRUE(store_->contains(Hash::of(bytes_of("a"))));
    EXPECT_TRUE(store_->contains(Hash::of(bytes_of("b"))));

    seq.value().release();
    EXPECT_EQ(store_->gc(), 3u);
}

TEST_F(BlobStoreTest, TempTagsAreReferenceCounted) {
    auto first = store_->import_bytes(bytes_of("shared"), BlobFormat::Raw);
    ASSERT_TRUE(first.is_ok());
    TempTag second = store_->temp_tag(first.value().hash_and_format());

    first.value().release();
    EXPECT_EQ(store_->gc(), 0u);

    TempTag moved = std::move(second);
    EXPECT_FALSE(second.active());
    EXPECT_TRUE(moved.active());

    moved.release();
    EXPECT_EQ(store_->gc(), 1u);
}

TEST(HashSeqTest, RejectsTruncatedSequences) {
    std::vector<uint8_t> data(33, 0);
    auto parsed = parse_hash_seq(data);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::Corrupt);
}
