#include "sendme/get/collection_materializer.hpp"

#include "sendme/path/sanitizer.hpp"

#include <spdlog/spdlog.h>

namespace sendme::get {
namespace fs = std::filesystem;

CollectionMaterializer::CollectionMaterializer(store::Store& store, store::ExportMode mode)
    : store_(store), mode_(mode) {}

Result<fs::path> CollectionMaterializer::export_entry(const store::CollectionEntry& entry,
                                                      const fs::path& destination_root) const {
    auto target = path::destination_path(destination_root, entry.name);
    if (target.is_error()) {
        return Err<fs::path>(target.error());
    }

    auto exported = store_.export_blob(entry.hash, target.value(), mode_);
    if (exported.is_error()) {
        return Err<fs::path>(ErrorKind::ExportFailed, entry.name + ": " + exported.error().message);
    }
    return Ok(target.value());
}

MaterializeReport CollectionMaterializer::materialize(const store::Collection& collection,
                                                      const fs::path& destination_root,
                                                      FailurePolicy policy,
                                                      const EntryCallback& on_exported) const {
    MaterializeReport report;
    std::size_t index = 0;
    for (const auto& entry : collection) {
        auto written = export_entry(entry, destination_root);
        if (written.is_error()) {
            spdlog::warn("Failed to export {}: {}", entry.name, written.error().message);
            report.failures.push_back(EntryFailure{entry.name, written.error()});
            if (policy == FailurePolicy::StopOnFirstError) {
                break;
            }
        } else {
            spdlog::debug("Exported {} to {}", entry.name, written.value().string());
            ++report.exported;
            if (on_exported) {
                on_exported(index, entry);
            }
        }
        ++index;
    }
    return report;
}

} // namespace sendme::get
