#pragma once

#include "sendme/store/store.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sendme::store {

class FsBlobWriter;

/**
 * @brief Store keeping one file per blob beneath a data directory
 *
 * LAYOUT:
 *   <root>/blobs/<64 hex chars>   committed blobs, named by content hash
 *   <root>/tmp/                   staging files of in-flight writes
 *
 * CONCURRENCY:
 * Commits (rename into blobs/ plus tag creation) take a shared lock and gc()
 * takes an exclusive one, so a freshly committed blob is always tagged before
 * a collection pass can observe it.
 */
class FsStore : public Store {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static Result<std::unique_ptr<FsStore>> open(const std::filesystem::path& root);

    /// Use open(); the tag keeps construction inside this class.
    FsStore(PrivateTag, std::filesystem::path root);

    Result<ImportOutcome> import_file(const std::filesystem::path& path, ImportMode mode) override;
    Result<TempTag> import_bytes(const std::vector<std::uint8_t>& data, BlobFormat format) override;
    Result<std::unique_ptr<BlobWriter>> begin_write() override;

    Result<void> export_blob(const Hash& hash,
                             const std::filesystem::path& target,
                             ExportMode mode) override;

    Result<std::vector<std::uint8_t>> read_blob(const Hash& hash) const override;
    Result<std::uint64_t> blob_size(const Hash& hash) const override;
    Result<std::filesystem::path> blob_path(const Hash& hash) const override;
    bool contains(const Hash& hash) const override;

    TempTag temp_tag(const HashAndFormat& value) override;
    std::size_t gc() override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    friend class FsBlobWriter;

    std::filesystem::path blob_file(const Hash& hash) const;
    std::filesystem::path make_staging_path();

    Result<TempTag> commit_staged(const std::filesystem::path& staged, const Hash& hash, BlobFormat format);

    void collect_protected(std::unordered_set<Hash>& protected_hashes) const;

    std::filesystem::path root_;
    std::filesystem::path blobs_dir_;
    std::filesystem::path tmp_dir_;
    std::string staging_prefix_;
    std::shared_ptr<TempTagSet> tags_;
    // blobs moved out of blobs/ by a reference export, and where they went
    std::unordered_map<Hash, std::filesystem::path> exported_;
    mutable std::shared_mutex mutex_;
    std::atomic<std::uint64_t> staging_counter_{0};
};

} // namespace sendme::store
