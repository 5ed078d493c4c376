#include "sendme/provide/collection_builder.hpp"

#include "sendme/path/sanitizer.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

namespace sendme::provide {
namespace fs = std::filesystem;

namespace {

std::size_t default_concurrency() {
    const auto units = std::thread::hardware_concurrency();
    return units == 0 ? 1 : static_cast<std::size_t>(units);
}

Error assembly_error(const std::string& context, const Error& cause) {
    return Error{ErrorKind::AssemblyFailed, context + ": " + cause.message};
}

} // namespace

CollectionBuilder::CollectionBuilder(store::Store& store, BuildOptions options)
    : store_(store),
      options_(options),
      concurrency_(options.concurrency == 0 ? default_concurrency() : options.concurrency) {}

Result<void> CollectionBuilder::walk(const fs::path& name_root,
                                     const fs::path& directory,
                                     std::vector<DataSource>& out) const {
    std::error_code ec;
    std::vector<fs::directory_entry> children;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        children.push_back(entry);
    }
    if (ec) {
        return Err<void>(ErrorKind::AssemblyFailed,
                         "Failed to list " + directory.string() + ": " + ec.message());
    }
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& child : children) {
        const auto status = child.symlink_status(ec);
        if (ec) {
            return Err<void>(ErrorKind::AssemblyFailed,
                             "Failed to stat " + child.path().string() + ": " + ec.message());
        }
        if (fs::is_symlink(status)) {
            spdlog::debug("Skipping symbolic link {}", child.path().string());
            continue;
        }
        if (fs::is_directory(status)) {
            if (!options_.exclude.empty() && fs::equivalent(child.path(), options_.exclude, ec)) {
                spdlog::debug("Skipping excluded directory {}", child.path().string());
                continue;
            }
            if (auto res = walk(name_root, child.path(), out); res.is_error()) {
                return res;
            }
            continue;
        }
        if (!fs::is_regular_file(status)) {
            spdlog::debug("Skipping special file {}", child.path().string());
            continue;
        }

        auto name = path::entry_name(name_root, child.path());
        if (name.is_error()) {
            return Err<void>(assembly_error(child.path().string(), name.error()));
        }
        out.push_back(DataSource{std::move(name.value()), child.path()});
    }
    return Ok();
}

Result<std::vector<DataSource>> CollectionBuilder::enumerate(const fs::path& root) const {
    std::error_code ec;
    const fs::path canonical = fs::canonical(root, ec);
    if (ec) {
        return Err<std::vector<DataSource>>(ErrorKind::NotFound,
                                            "path " + root.string() + " does not exist");
    }
    if (!canonical.has_relative_path()) {
        return Err<std::vector<DataSource>>(ErrorKind::InvalidPath,
                                            "cannot share the filesystem root");
    }
    const fs::path name_root = canonical.parent_path();

    std::vector<DataSource> sources;
    const auto status = fs::status(canonical, ec);
    if (fs::is_regular_file(status)) {
        auto name = path::entry_name(name_root, canonical);
        if (name.is_error()) {
            return Err<std::vector<DataSource>>(assembly_error(canonical.string(), name.error()));
        }
        sources.push_back(DataSource{std::move(name.value()), canonical});
    } else if (fs::is_directory(status)) {
        if (auto res = walk(name_root, canonical, sources); res.is_error()) {
            return Err<std::vector<DataSource>>(res.error());
        }
    } else {
        return Err<std::vector<DataSource>>(ErrorKind::AssemblyFailed,
                                            canonical.string() + " is neither a file nor a directory");
    }

    std::unordered_set<std::string> seen;
    for (const auto& source : sources) {
        if (!seen.insert(source.name).second) {
            return Err<std::vector<DataSource>>(ErrorKind::AssemblyFailed,
                                                "duplicate entry name " + source.name);
        }
    }
    return Ok(std::move(sources));
}

Result<std::vector<store::ImportOutcome>> CollectionBuilder::ingest(const std::vector<DataSource>& sources) {
    std::mutex mutex;
    std::vector<std::pair<std::size_t, store::ImportOutcome>> completed;
    std::optional<Error> first_error;
    std::atomic<bool> failed{false};

    completed.reserve(sources.size());
    {
        boost::asio::thread_pool pool(concurrency_);
        for (std::size_t i = 0; i < sources.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                if (failed.load() || (options_.cancelled && options_.cancelled->load())) {
                    return;
                }
                auto imported = store_.import_file(sources[i].path, options_.import_mode);

                std::lock_guard lock(mutex);
                if (imported.is_error()) {
                    if (!first_error) {
                        first_error = assembly_error(sources[i].name, imported.error());
                    }
                    failed.store(true);
                    return;
                }
                completed.emplace_back(i, std::move(imported.value()));
            });
        }
        pool.join();
    }

    // Tags of already completed imports are released when `completed` goes
    // out of scope on the failure paths below.
    if (first_error) {
        return Err<std::vector<store::ImportOutcome>>(*first_error);
    }
    if (options_.cancelled && options_.cancelled->load()) {
        return Err<std::vector<store::ImportOutcome>>(ErrorKind::AssemblyFailed, "import cancelled");
    }

    std::sort(completed.begin(), completed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<store::ImportOutcome> ordered;
    ordered.reserve(completed.size());
    for (auto& [index, outcome] : completed) {
        ordered.push_back(std::move(outcome));
    }
    return Ok(std::move(ordered));
}

Result<BuildOutcome> CollectionBuilder::build(const fs::path& root) {
    auto sources = enumerate(root);
    if (sources.is_error()) {
        return Err<BuildOutcome>(sources.error());
    }
    spdlog::info("Importing {} file(s) from {} with {} worker(s)",
                 sources.value().size(), root.string(), concurrency_);

    auto imported = ingest(sources.value());
    if (imported.is_error()) {
        return Err<BuildOutcome>(imported.error());
    }

    BuildOutcome outcome;
    std::vector<store::TempTag> member_tags;
    member_tags.reserve(imported.value().size());
    for (std::size_t i = 0; i < imported.value().size(); ++i) {
        auto& item = imported.value()[i];
        outcome.total_size += item.size;
        outcome.collection.push(sources.value()[i].name, item.tag.hash());
        member_tags.push_back(std::move(item.tag));
    }

    auto root_tag = outcome.collection.store(store_);
    if (root_tag.is_error()) {
        return Err<BuildOutcome>(assembly_error("storing collection", root_tag.error()));
    }
    outcome.tag = std::move(root_tag.value());

    // The stored collection now protects every member.
    member_tags.clear();

    spdlog::info("Stored collection {} ({} entries, {} bytes)",
                 outcome.tag.hash().to_hex(), outcome.collection.size(), outcome.total_size);
    return Ok(std::move(outcome));
}

} // namespace sendme::provide
