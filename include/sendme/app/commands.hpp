#pragma once

#include "sendme/app/config.hpp"
#include "sendme/core/result.hpp"
#include "sendme/net/secret_key.hpp"
#include "sendme/net/ticket.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace sendme::app {

inline constexpr const char* kProvideStoreDir = ".sendme-provide";
inline constexpr const char* kGetStoreDir = ".sendme-get";

/**
 * @brief Removes a directory tree when it goes out of scope
 *
 * Used for the per-command blob stores. keep() disarms it.
 */
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedDirectory();

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    void keep() { keep_ = true; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool keep_ = false;
};

/// Called with the printed ticket right before the provider starts serving.
using ReadyCallback = std::function<void(const net::Ticket&)>;

/**
 * Import @p options.path, print a ticket and serve it until SIGINT/SIGTERM.
 * The store lives in <working_dir>/.sendme-provide.
 */
Result<void> run_provide(const ProvideOptions& options,
                         const net::SecretKey& key,
                         const std::filesystem::path& working_dir,
                         const ReadyCallback& on_ready = {});

struct DownloadSize {
    std::uint64_t files = 0;
    std::uint64_t bytes = 0;
};

/**
 * What a sizes reply means to the user. For a collection the first size is
 * the metadata blob and is left out.
 */
DownloadSize download_size(const store::HashAndFormat& content, const std::vector<std::uint64_t>& sizes);

/**
 * Download the ticket's content and write it below @p working_dir.
 * The store lives in <working_dir>/.sendme-get. Files are moved out of the
 * store unless it is kept, in which case they are copied.
 */
Result<void> run_get(const GetOptions& options,
                     const net::SecretKey& key,
                     const std::filesystem::path& working_dir);

} // namespace sendme::app
