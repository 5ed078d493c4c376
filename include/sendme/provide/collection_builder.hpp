#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/collection.hpp"
#include "sendme/store/store.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sendme::provide {

/**
 * @brief A regular file found beneath the import root, with its entry name
 */
struct DataSource {
    std::string name;
    std::filesystem::path path;
};

struct BuildOutcome {
    store::TempTag tag;              ///< Protects the stored collection root
    store::Collection collection;
    std::uint64_t total_size = 0;    ///< Sum of member sizes
};

struct BuildOptions {
    std::size_t concurrency = 0;     ///< 0 = number of available processing units
    store::ImportMode import_mode = store::ImportMode::TryReference;
    const std::atomic<bool>* cancelled = nullptr;
    std::filesystem::path exclude;   ///< Directory never descended into (e.g. the store itself)
};

/**
 * @brief Turns a file or directory into a stored collection
 *
 * Entry names are relative to the parent of the import root, so a single
 * file becomes one entry named after the file and a directory's entries are
 * prefixed with the directory's own name. Symbolic links are skipped.
 *
 * Ingestion runs on a fixed-width worker pool; results are put back into
 * enumeration order before the collection is assembled. Any failure aborts
 * the build and nothing is persisted.
 */
class CollectionBuilder {
public:
    explicit CollectionBuilder(store::Store& store, BuildOptions options = {});

    /**
     * @brief List every regular file beneath @p root in deterministic order
     *
     * Directory children are visited sorted by name, depth first.
     */
    Result<std::vector<DataSource>> enumerate(const std::filesystem::path& root) const;

    Result<BuildOutcome> build(const std::filesystem::path& root);

    [[nodiscard]] std::size_t concurrency() const noexcept { return concurrency_; }

private:
    Result<std::vector<store::ImportOutcome>> ingest(const std::vector<DataSource>& sources);

    Result<void> walk(const std::filesystem::path& name_root,
                      const std::filesystem::path& directory,
                      std::vector<DataSource>& out) const;

    store::Store& store_;
    BuildOptions options_;
    std::size_t concurrency_;
};

} // namespace sendme::provide
