#include "sendme/store/fs_store.hpp"
#include "sendme/store/hash_seq.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

namespace sendme::store {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyChunkSize = 64 * 1024;

/**
 * Removes a staging file on scope exit unless it was handed over to the
 * blob directory.
 */
class StagingGuard {
public:
    explicit StagingGuard(fs::path path) : path_(std::move(path)) {}
    ~StagingGuard() {
        if (armed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    StagingGuard(const StagingGuard&) = delete;
    StagingGuard& operator=(const StagingGuard&) = delete;

    const fs::path& path() const noexcept { return path_; }
    void disarm() noexcept { armed_ = false; }

private:
    fs::path path_;
    bool armed_ = true;
};

std::string random_prefix() {
    std::random_device rd;
    std::ostringstream oss;
    oss << std::hex << rd() << rd();
    return oss.str();
}

} // namespace

// ──────────────────────────────────────────────────────────
// FsBlobWriter
// ──────────────────────────────────────────────────────────

class FsBlobWriter : public BlobWriter {
public:
    FsBlobWriter(FsStore& store, fs::path staged)
        : store_(store), guard_(std::move(staged)) {
        output_.open(guard_.path(), std::ios::binary | std::ios::trunc);
    }

    bool is_open() const { return output_.is_open(); }

    Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (committed_) {
            return Err<void>(ErrorKind::InvalidArgument, "write after commit");
        }
        output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!output_) {
            return Err<void>(ErrorKind::Io, "Failed to write staging file: " + guard_.path().string());
        }
        hasher_.update(data, size);
        written_ += size;
        return Ok();
    }

    Result<TempTag> commit(const Hash& expected, BlobFormat format) override {
        if (committed_) {
            return Err<TempTag>(ErrorKind::InvalidArgument, "blob already committed");
        }
        output_.close();
        if (!output_) {
            return Err<TempTag>(ErrorKind::Io, "Failed to flush staging file: " + guard_.path().string());
        }
        const Hash actual = hasher_.finalize();
        committed_ = true;
        if (actual != expected) {
            return Err<TempTag>(ErrorKind::Corrupt,
                                "hash mismatch: expected " + expected.to_hex() + ", got " + actual.to_hex());
        }
        auto tag = store_.commit_staged(guard_.path(), actual, format);
        if (tag.is_ok()) {
            guard_.disarm();
        }
        return tag;
    }

    std::uint64_t bytes_written() const noexcept override { return written_; }

private:
    FsStore& store_;
    StagingGuard guard_;
    std::ofstream output_;
    Hasher hasher_;
    std::uint64_t written_ = 0;
    bool committed_ = false;
};

// ──────────────────────────────────────────────────────────
// FsStore
// ──────────────────────────────────────────────────────────

FsStore::FsStore(PrivateTag, fs::path root)
    : root_(std::move(root)),
      blobs_dir_(root_ / "blobs"),
      tmp_dir_(root_ / "tmp"),
      staging_prefix_(random_prefix()),
      tags_(std::make_shared<TempTagSet>()) {}

Result<std::unique_ptr<FsStore>> FsStore::open(const fs::path& root) {
    auto store = std::make_unique<FsStore>(PrivateTag{}, root);

    std::error_code ec;
    fs::create_directories(store->blobs_dir_, ec);
    if (ec) {
        return Err<std::unique_ptr<FsStore>>(ErrorKind::Io,
            "Failed to create directory " + store->blobs_dir_.string() + ": " + ec.message());
    }
    fs::create_directories(store->tmp_dir_, ec);
    if (ec) {
        return Err<std::unique_ptr<FsStore>>(ErrorKind::Io,
            "Failed to create directory " + store->tmp_dir_.string() + ": " + ec.message());
    }

    // Staging files left behind by an interrupted run are never referenced.
    std::size_t stale = 0;
    for (const auto& entry : fs::directory_iterator(store->tmp_dir_, ec)) {
        std::error_code remove_ec;
        if (fs::remove(entry.path(), remove_ec)) {
            ++stale;
        }
    }
    if (stale > 0) {
        spdlog::debug("Removed {} stale staging file(s) from {}", stale, store->tmp_dir_.string());
    }

    spdlog::debug("Opened blob store at {}", root.string());
    return Ok(std::move(store));
}

fs::path FsStore::blob_file(const Hash& hash) const {
    return blobs_dir_ / hash.to_hex();
}

fs::path FsStore::make_staging_path() {
    const auto id = staging_counter_.fetch_add(1);
    return tmp_dir_ / (staging_prefix_ + "-" + std::to_string(id) + ".partial");
}

Result<TempTag> FsStore::commit_staged(const fs::path& staged, const Hash& hash, BlobFormat format) {
    std::shared_lock lock(mutex_);
    const auto target = blob_file(hash);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        // Same content already stored
        fs::remove(staged, ec);
    } else {
        fs::rename(staged, target, ec);
        if (ec) {
            return Err<TempTag>(ErrorKind::Io,
                                "Failed to move blob into place: " + target.string() + ": " + ec.message());
        }
    }
    return Ok(TempTag(HashAndFormat{hash, format}, tags_));
}

Result<ImportOutcome> FsStore::import_file(const fs::path& path, ImportMode mode) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Err<ImportOutcome>(ErrorKind::NotFound, "No such file: " + path.string());
    }
    if (!fs::is_regular_file(status)) {
        return Err<ImportOutcome>(ErrorKind::Io, "Not a regular file: " + path.string());
    }

    StagingGuard staged(make_staging_path());

    bool linked = false;
    if (mode == ImportMode::TryReference) {
        fs::create_hard_link(path, staged.path(), ec);
        linked = !ec;
        if (!linked) {
            spdlog::debug("Cannot reference {} ({}), copying instead", path.string(), ec.message());
        }
    }

    std::ifstream input(linked ? staged.path() : path, std::ios::binary);
    if (!input) {
        return Err<ImportOutcome>(ErrorKind::Io, "Failed to open source file: " + path.string());
    }

    std::ofstream output;
    if (!linked) {
        output.open(staged.path(), std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<ImportOutcome>(ErrorKind::Io, "Failed to create staging file: " + staged.path().string());
        }
    }

    Hasher hasher;
    std::uint64_t size = 0;
    std::vector<char> buffer(kCopyChunkSize);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = input.gcount();
        hasher.update(buffer.data(), static_cast<std::size_t>(count));
        if (!linked) {
            output.write(buffer.data(), count);
            if (!output) {
                return Err<ImportOutcome>(ErrorKind::Io, "Failed to write staging file: " + staged.path().string());
            }
        }
        size += static_cast<std::uint64_t>(count);
    }
    if (input.bad()) {
        return Err<ImportOutcome>(ErrorKind::Io, "Failed to read source file: " + path.string());
    }
    input.close();
    if (!linked) {
        output.close();
        if (!output) {
            return Err<ImportOutcome>(ErrorKind::Io, "Failed to flush staging file: " + staged.path().string());
        }
    }

    auto tag = commit_staged(staged.path(), hasher.finalize(), BlobFormat::Raw);
    if (tag.is_error()) {
        return Err<ImportOutcome>(tag.error());
    }
    staged.disarm();

    spdlog::debug("Imported {} ({} bytes) as {}", path.string(), size, tag.value().hash().to_hex());
    return Ok(ImportOutcome{std::move(tag.value()), size});
}

Result<TempTag> FsStore::import_bytes(const std::vector<std::uint8_t>& data, BlobFormat format) {
    auto writer = begin_write();
    if (writer.is_error()) {
        return Err<TempTag>(writer.error());
    }
    if (auto res = writer.value()->write(data.data(), data.size()); res.is_error()) {
        return Err<TempTag>(res.error());
    }
    return writer.value()->commit(Hash::of(data), format);
}

Result<std::unique_ptr<BlobWriter>> FsStore::begin_write() {
    auto writer = std::make_unique<FsBlobWriter>(*this, make_staging_path());
    if (!writer->is_open()) {
        return Err<std::unique_ptr<BlobWriter>>(ErrorKind::Io, "Failed to create staging file in " + tmp_dir_.string());
    }
    return Ok(std::unique_ptr<BlobWriter>(std::move(writer)));
}

Result<void> FsStore::export_blob(const Hash& hash, const fs::path& target, ExportMode mode) {
    std::unique_lock lock(mutex_);
    std::error_code ec;

    // a blob handed over by an earlier reference export is copied from there
    auto source = blob_file(hash);
    bool owned = true;
    if (!fs::exists(source, ec)) {
        const auto moved = exported_.find(hash);
        if (moved == exported_.end() || !fs::is_regular_file(moved->second, ec)) {
            return Err<void>(ErrorKind::NotFound, "Blob not found: " + hash.to_hex());
        }
        source = moved->second;
        owned = false;
    }
    if (fs::exists(fs::symlink_status(target, ec))) {
        return Err<void>(ErrorKind::ExportFailed, "Refusing to overwrite existing file: " + target.string());
    }

    const auto parent = target.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::is_directory(parent)) {
            return Err<void>(ErrorKind::ExportFailed, "Failed to create directory: " + parent.string());
        }
    }

    if (mode == ExportMode::TryReference && owned) {
        // a blob linked from an imported source file stays shared; copy it
        const auto links = fs::hard_link_count(source, ec);
        if (!ec && links == 1) {
            fs::rename(source, target, ec);
            if (!ec) {
                exported_.insert_or_assign(hash, target);
                return Ok();
            }
        }
        spdlog::debug("Cannot move {} to {} ({}), copying instead",
                      hash.to_hex(), target.string(), ec ? ec.message() : "blob has other links");
    }

    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec) {
        return Err<void>(ErrorKind::ExportFailed, "Failed to export to " + target.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> FsStore::read_blob(const Hash& hash) const {
    std::shared_lock lock(mutex_);
    const auto path = blob_file(hash);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::NotFound, "Blob not found: " + hash.to_hex());
    }
    std::vector<std::uint8_t> data{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to read blob: " + hash.to_hex());
    }
    return Ok(std::move(data));
}

Result<std::uint64_t> FsStore::blob_size(const Hash& hash) const {
    std::shared_lock lock(mutex_);
    std::error_code ec;
    const auto size = fs::file_size(blob_file(hash), ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorKind::NotFound, "Blob not found: " + hash.to_hex());
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<fs::path> FsStore::blob_path(const Hash& hash) const {
    if (!contains(hash)) {
        return Err<fs::path>(ErrorKind::NotFound, "Blob not found: " + hash.to_hex());
    }
    return Ok(blob_file(hash));
}

bool FsStore::contains(const Hash& hash) const {
    std::shared_lock lock(mutex_);
    std::error_code ec;
    return fs::is_regular_file(blob_file(hash), ec);
}

TempTag FsStore::temp_tag(const HashAndFormat& value) {
    return TempTag(value, tags_);
}

void FsStore::collect_protected(std::unordered_set<Hash>& protected_hashes) const {
    for (const auto& value : tags_->live()) {
        protected_hashes.insert(value.hash);
        if (value.format != BlobFormat::HashSeq) {
            continue;
        }
        std::ifstream input(blob_file(value.hash), std::ios::binary);
        if (!input) {
            continue;
        }
        std::vector<std::uint8_t> data{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
        auto children = parse_hash_seq(data);
        if (children.is_error()) {
            spdlog::warn("Protected hash sequence {} is malformed: {}", value.hash.to_hex(), children.error().message);
            continue;
        }
        protected_hashes.insert(children.value().begin(), children.value().end());
    }
}

std::size_t FsStore::gc() {
    std::unique_lock lock(mutex_);

    std::unordered_set<Hash> protected_hashes;
    collect_protected(protected_hashes);

    std::vector<fs::path> doomed;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(blobs_dir_, ec)) {
        auto parsed = Hash::from_hex(entry.path().filename().string());
        if (parsed.is_error()) {
            continue;
        }
        if (protected_hashes.count(parsed.value()) == 0) {
            doomed.push_back(entry.path());
        }
    }

    std::size_t removed = 0;
    for (const auto& path : doomed) {
        std::error_code remove_ec;
        if (fs::remove(path, remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            spdlog::warn("Failed to remove unreferenced blob {}: {}", path.string(), remove_ec.message());
        }
    }
    spdlog::debug("gc removed {} unreferenced blob(s)", removed);
    return removed;
}

} // namespace sendme::store
