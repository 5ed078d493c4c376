#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/hash.hpp"
#include "sendme/store/temp_tag.hpp"
#include "sendme/store/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace sendme::store {

struct ImportOutcome {
    TempTag tag;
    std::uint64_t size = 0;
};

/**
 * @brief Incremental writer for a blob whose hash is known in advance
 *
 * Bytes are staged privately. commit() verifies them against the expected
 * hash and publishes the blob; a writer destroyed without a successful
 * commit discards everything it staged.
 */
class BlobWriter {
public:
    virtual ~BlobWriter() = default;

    virtual Result<void> write(const std::uint8_t* data, std::size_t size) = 0;
    virtual Result<TempTag> commit(const Hash& expected, BlobFormat format) = 0;
    [[nodiscard]] virtual std::uint64_t bytes_written() const noexcept = 0;
};

/**
 * @brief Content-addressed blob store
 *
 * Implementations must allow every operation to be called concurrently from
 * several threads without external locking.
 */
class Store {
public:
    virtual ~Store() = default;

    virtual Result<ImportOutcome> import_file(const std::filesystem::path& path, ImportMode mode) = 0;
    virtual Result<TempTag> import_bytes(const std::vector<std::uint8_t>& data, BlobFormat format) = 0;
    virtual Result<std::unique_ptr<BlobWriter>> begin_write() = 0;

    virtual Result<void> export_blob(const Hash& hash,
                                     const std::filesystem::path& target,
                                     ExportMode mode) = 0;

    virtual Result<std::vector<std::uint8_t>> read_blob(const Hash& hash) const = 0;
    virtual Result<std::uint64_t> blob_size(const Hash& hash) const = 0;
    virtual Result<std::filesystem::path> blob_path(const Hash& hash) const = 0;
    virtual bool contains(const Hash& hash) const = 0;

    virtual TempTag temp_tag(const HashAndFormat& value) = 0;

    /**
     * Remove every blob not protected by a live temp tag, directly or as a
     * child of a protected HashSeq. Returns the number of blobs removed.
     */
    virtual std::size_t gc() = 0;
};

} // namespace sendme::store
