#include "sendme/get/collection_materializer.hpp"
#include "sendme/provide/collection_builder.hpp"
#include "sendme/store/fs_store.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using sendme::ErrorKind;
using namespace sendme::get;
using namespace sendme::store;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("sendme_materializer_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

Hash hash_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return Hash::of(bytes);
}

/// relative path -> content hash for every regular file beneath @p root
std::map<std::string, Hash> snapshot(const fs::path& root) {
    std::map<std::string, Hash> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.emplace(entry.path().lexically_relative(root).generic_string(), hash_file(entry.path()));
        }
    }
    return files;
}

} // namespace

class CollectionMaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir();
        auto opened = FsStore::open(dir_ / "store");
        ASSERT_TRUE(opened.is_ok());
        store_ = std::move(opened.value());
        fs::create_directories(dir_ / "out");
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::unique_ptr<FsStore> store_;
};

TEST_F(CollectionMaterializerTest, RoundTripReproducesTree) {
    write_file(dir_ / "src" / "tree" / "one.txt", "first file");
    write_file(dir_ / "src" / "tree" / "nested" / "two.bin", std::string(100000, 'x'));
    write_file(dir_ / "src" / "tree" / "nested" / "deeper" / "three", "");

    sendme::provide::CollectionBuilder builder(*store_);
    auto built = builder.build(dir_ / "src" / "tree");
    ASSERT_TRUE(built.is_ok());

    auto loaded = Collection::load(*store_, built.value().tag.hash());
    ASSERT_TRUE(loaded.is_ok());

    std::vector<std::string> seen;
    CollectionMaterializer materializer(*store_, ExportMode::Copy);
    auto report = materializer.materialize(
        loaded.value(), dir_ / "out", FailurePolicy::StopOnFirstError,
        [&](std::size_t, const CollectionEntry& entry) { seen.push_back(entry.name); });

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.exported, 3u);
    EXPECT_EQ(seen.size(), 3u);
    EXPECT_EQ(snapshot(dir_ / "out" / "tree"), snapshot(dir_ / "src" / "tree"));
}

TEST_F(CollectionMaterializerTest, MaliciousNameIsRejectedPerEntry) {
    auto good = store_->import_bytes(std::vector<uint8_t>{'o', 'k'}, BlobFormat::Raw);
    auto evil = store_->import_bytes(std::vector<uint8_t>{'p', 'w', 'n'}, BlobFormat::Raw);
    ASSERT_TRUE(good.is_ok() && evil.is_ok());

    Collection collection;
    collection.push("../escape.txt", evil.value().hash());
    collection.push("safe/ok.txt", good.value().hash());

    CollectionMaterializer materializer(*store_);
    auto report = materializer.materialize(collection, dir_ / "out", FailurePolicy::ContinueOnError);

    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].name, "../escape.txt");
    EXPECT_EQ(report.failures[0].error.kind, ErrorKind::InvalidPath);
    EXPECT_EQ(report.exported, 1u);

    EXPECT_FALSE(fs::exists(dir_ / "escape.txt"));
    EXPECT_TRUE(fs::exists(dir_ / "out" / "safe" / "ok.txt"));
}

TEST_F(CollectionMaterializerTest, StopOnFirstErrorSkipsTheRest) {
    auto blob = store_->import_bytes(std::vector<uint8_t>{'x'}, BlobFormat::Raw);
    ASSERT_TRUE(blob.is_ok());

    Collection collection;
    collection.push("/etc/passwd", blob.value().hash());
    collection.push("fine.txt", blob.value().hash());

    CollectionMaterializer materializer(*store_);
    auto report = materializer.materialize(collection, dir_ / "out", FailurePolicy::StopOnFirstError);

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.exported, 0u);
    EXPECT_FALSE(fs::exists(dir_ / "out" / "fine.txt"));
}

TEST_F(CollectionMaterializerTest, ExistingFileIsExportFailure) {
    auto blob = store_->import_bytes(std::vector<uint8_t>{'n', 'e', 'w'}, BlobFormat::Raw);
    ASSERT_TRUE(blob.is_ok());
    write_file(dir_ / "out" / "taken.txt", "old");

    CollectionMaterializer materializer(*store_);
    auto exported = materializer.export_entry(CollectionEntry{"taken.txt", blob.value().hash()}, dir_ / "out");
    ASSERT_TRUE(exported.is_error());
    EXPECT_EQ(exported.error().kind, ErrorKind::ExportFailed);

    std::ifstream in(dir_ / "out" / "taken.txt");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "old");
}

TEST_F(CollectionMaterializerTest, MissingBlobIsExportFailure) {
    Collection collection;
    collection.push("ghost.txt", Hash::of(std::vector<uint8_t>{'g'}));

    CollectionMaterializer materializer(*store_);
    auto report = materializer.materialize(collection, dir_ / "out");
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].error.kind, ErrorKind::ExportFailed);
}

TEST_F(CollectionMaterializerTest, SameContentEntriesAreIndependentFiles) {
    write_file(dir_ / "src" / "share" / "a.txt", "same");
    write_file(dir_ / "src" / "share" / "b.txt", "same");

    sendme::provide::CollectionBuilder builder(*store_);
    auto built = builder.build(dir_ / "src" / "share");
    ASSERT_TRUE(built.is_ok());
    auto loaded = Collection::load(*store_, built.value().tag.hash());
    ASSERT_TRUE(loaded.is_ok());

    CollectionMaterializer materializer(*store_, ExportMode::TryReference);
    auto report = materializer.materialize(loaded.value(), dir_ / "out", FailurePolicy::StopOnFirstError);
    ASSERT_TRUE(report.ok());

    const auto a = dir_ / "out" / "share" / "a.txt";
    const auto b = dir_ / "out" / "share" / "b.txt";
    EXPECT_EQ(fs::hard_link_count(a), 1u);
    EXPECT_EQ(fs::hard_link_count(b), 1u);

    write_file(b, "edited");
    EXPECT_EQ(hash_file(a), Hash::of(std::vector<uint8_t>{'s', 'a', 'm', 'e'}));
    // the source tree is untouched as well
    EXPECT_EQ(hash_file(dir_ / "src" / "share" / "a.txt"), hash_file(a));
}
