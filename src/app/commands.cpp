#include "sendme/app/commands.hpp"

#include "sendme/events/components.hpp"
#include "sendme/events/event_bus.hpp"
#include "sendme/get/collection_materializer.hpp"
#include "sendme/get/progress_reducer.hpp"
#include "sendme/get/progress_renderer.hpp"
#include "sendme/net/getter.hpp"
#include "sendme/net/provider.hpp"
#include "sendme/net/ticket.hpp"
#include "sendme/provide/collection_builder.hpp"
#include "sendme/store/collection.hpp"
#include "sendme/store/fs_store.hpp"

#include <boost/asio/signal_set.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace sendme::app {

ScopedDirectory::~ScopedDirectory() {
    if (keep_) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
    }
}

Result<void> run_provide(const ProvideOptions& options,
                         const net::SecretKey& key,
                         const fs::path& working_dir,
                         const ReadyCallback& on_ready) {
    const auto store_dir = working_dir / kProvideStoreDir;
    std::error_code ec;
    if (fs::exists(store_dir, ec)) {
        return Err<void>(ErrorKind::InvalidArgument, "can not share twice from the same directory");
    }

    ScopedDirectory store_guard(store_dir);
    auto store = store::FsStore::open(store_dir);
    if (store.is_error()) {
        return Err<void>(store.error());
    }

    provide::BuildOptions build_options;
    build_options.exclude = store_dir;
    provide::CollectionBuilder builder(*store.value(), build_options);
    auto outcome = builder.build(options.path);
    if (outcome.is_error()) {
        return Err<void>(outcome.error());
    }
    auto& built = outcome.value();
    fmt::print("imported {}, {} bytes\n", options.path.string(), built.total_size);

    boost::asio::io_context io_context;
    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::StatsComponent stats(bus);

    auto provider = net::Provider::bind(io_context, *store.value(), bus, key.node_id(),
                                        options.bind_address, options.port);
    if (provider.is_error()) {
        return Err<void>(provider.error());
    }
    provider.value()->start();

    net::Ticket ticket;
    ticket.addresses = provider.value()->advertised_addresses();
    ticket.node_id = key.node_id();
    ticket.content = built.tag.hash_and_format();

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& wait_ec, int signal_number) {
        if (wait_ec) {
            return;
        }
        bus.emit(events::ProviderShuttingDownEvent{"signal " + std::to_string(signal_number)});
        provider.value()->stop();
        io_context.stop();
    });

    fmt::print("use\nsendme get {}\nto get this data\n", ticket.to_string());
    std::fflush(stdout);
    if (on_ready) {
        on_ready(ticket);
    }

    io_context.run();

    stats.print_stats();
    built.tag.release();
    return Ok();
}

DownloadSize download_size(const store::HashAndFormat& content, const std::vector<std::uint64_t>& sizes) {
    const std::size_t skip = (content.format == store::BlobFormat::HashSeq && !sizes.empty()) ? 1 : 0;
    DownloadSize size;
    size.files = sizes.size() - skip;
    for (std::size_t i = skip; i < sizes.size(); ++i) {
        size.bytes += sizes[i];
    }
    return size;
}

namespace {

Result<store::Collection> received_collection(const store::Store& store, const store::HashAndFormat& content) {
    if (content.format == store::BlobFormat::HashSeq) {
        return store::Collection::load(store, content.hash);
    }
    // a bare blob has no name of its own; it is written under its hash
    store::Collection single;
    single.push(content.hash.to_hex(), content.hash);
    return Ok(std::move(single));
}

} // namespace

Result<void> run_get(const GetOptions& options,
                     const net::SecretKey& key,
                     const fs::path& working_dir) {
    auto ticket = net::Ticket::parse(options.ticket);
    if (ticket.is_error()) {
        return Err<void>(ticket.error());
    }

    ScopedDirectory store_guard(working_dir / kGetStoreDir);
    if (options.keep_store) {
        store_guard.keep();
    }
    auto store = store::FsStore::open(store_guard.path());
    if (store.is_error()) {
        return Err<void>(store.error());
    }

    spdlog::debug("Local node {}", key.node_id().to_hex());

    boost::asio::io_context io_context;
    auto getter = net::Getter::connect(io_context, ticket.value());
    if (getter.is_error()) {
        return Err<void>(getter.error());
    }

    auto sizes = getter.value()->fetch_sizes();
    if (sizes.is_error()) {
        return Err<void>(ErrorKind::TransferAborted, "download aborted: " + sizes.error().message);
    }
    const auto size = download_size(ticket.value().content, sizes.value());
    fmt::print(stderr, "getting {} files, {} bytes\n", size.files, size.bytes);
    std::fflush(stderr);

    net::TransferFeed feed;
    std::optional<Result<store::TempTag>> fetched;
    std::thread worker([&]() {
        fetched.emplace(getter.value()->fetch(*store.value(), feed));
    });

    get::TransferProgressReducer reducer;
    get::ProgressRenderer renderer(stderr);
    while (auto event = feed.pop()) {
        renderer.render(reducer.apply(*event));
    }
    worker.join();
    renderer.finish(reducer.state());

    if (fetched->is_error()) {
        return Err<void>(ErrorKind::TransferAborted, "download aborted: " + fetched->error().message);
    }
    auto summary = reducer.outcome();
    if (summary.is_error()) {
        return Err<void>(summary.error());
    }
    store::TempTag root_tag = std::move(fetched->value());

    auto collection = received_collection(*store.value(), ticket.value().content);
    if (collection.is_error()) {
        return Err<void>(collection.error());
    }

    const auto export_mode = options.keep_store ? store::ExportMode::Copy : store::ExportMode::TryReference;
    get::CollectionMaterializer materializer(*store.value(), export_mode);
    auto report = materializer.materialize(
        collection.value(), working_dir, get::FailurePolicy::StopOnFirstError,
        [](std::size_t index, const store::CollectionEntry& entry) {
            spdlog::debug("Exported [{}] {}", index, entry.name);
        });
    if (!report.ok()) {
        return Err<void>(report.failures.front().error);
    }

    spdlog::info("Exported {} file(s) into {}", report.exported, working_dir.string());
    return Ok();
}

} // namespace sendme::app
