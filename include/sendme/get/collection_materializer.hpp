#pragma once

#include "sendme/core/result.hpp"
#include "sendme/store/collection.hpp"
#include "sendme/store/store.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace sendme::get {

enum class FailurePolicy {
    StopOnFirstError,
    ContinueOnError
};

struct EntryFailure {
    std::string name;
    Error error;
};

struct MaterializeReport {
    std::size_t exported = 0;
    std::vector<EntryFailure> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

/**
 * @brief Writes the entries of a received collection below a destination root
 *
 * Every stored name is sanitized again before use, since the collection may
 * come from an untrusted peer. Failures are reported per entry.
 */
class CollectionMaterializer {
public:
    using EntryCallback = std::function<void(std::size_t index, const store::CollectionEntry& entry)>;

    explicit CollectionMaterializer(store::Store& store,
                                    store::ExportMode mode = store::ExportMode::TryReference);

    /// Export a single entry; returns the path written.
    Result<std::filesystem::path> export_entry(const store::CollectionEntry& entry,
                                               const std::filesystem::path& destination_root) const;

    MaterializeReport materialize(const store::Collection& collection,
                                  const std::filesystem::path& destination_root,
                                  FailurePolicy policy = FailurePolicy::StopOnFirstError,
                                  const EntryCallback& on_exported = {}) const;

private:
    store::Store& store_;
    store::ExportMode mode_;
};

} // namespace sendme::get
