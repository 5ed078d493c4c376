/**
 * @file components.hpp
 * @brief Subscribers attached to the provider's EventBus by the CLI
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * StatsComponent stats(bus);
 * Provider provider(io, store, bus, ...);
 */

#pragma once

#include "sendme/events/event_bus.hpp"
#include "sendme/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace sendme::events {

/**
 * @brief Logs every provider event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<ProviderStartedEvent>([](const ProviderStartedEvent& e) {
            spdlog::info("[ProviderStarted] listening on {}:{}", e.address, e.port);
        });

        bus.subscribe<ProviderShuttingDownEvent>([](const ProviderShuttingDownEvent& e) {
            spdlog::info("[ProviderShuttingDown] reason={}", e.reason);
        });

        bus.subscribe<ClientConnectedEvent>([](const ClientConnectedEvent& e) {
            spdlog::info("[ClientConnected] conn={} remote={}", e.connection_id, e.remote);
        });

        bus.subscribe<RequestReceivedEvent>([](const RequestReceivedEvent& e) {
            spdlog::info("[RequestReceived] conn={} kind={} hash={} format={}",
                e.connection_id,
                e.kind == RequestReceivedEvent::Kind::Sizes ? "sizes" : "get",
                e.hash.to_hex(),
                store::format_name(e.format));
        });

        bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] conn={} hash={} blobs={} bytes={} elapsed_ms={}",
                e.connection_id,
                e.hash.to_hex(),
                e.blobs_sent,
                e.bytes_sent,
                std::chrono::duration_cast<std::chrono::milliseconds>(e.elapsed).count());
        });

        bus.subscribe<TransferAbortedEvent>([](const TransferAbortedEvent& e) {
            spdlog::warn("[TransferAborted] conn={} reason={}", e.connection_id, e.reason);
        });
    }
};

/**
 * @brief Session counters for the provider, printed on shutdown
 */
class StatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> connections{0};
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_aborted{0};
        std::atomic<uint64_t> bytes_sent{0};
    };

    explicit StatsComponent(EventBus& bus) {
        bus.subscribe<ClientConnectedEvent>([this](const ClientConnectedEvent&) {
            stats_.connections++;
        });

        bus.subscribe<RequestReceivedEvent>([this](const RequestReceivedEvent&) {
            stats_.requests++;
        });

        bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            stats_.transfers_completed++;
            stats_.bytes_sent += e.bytes_sent;
        });

        bus.subscribe<TransferAbortedEvent>([this](const TransferAbortedEvent&) {
            stats_.transfers_aborted++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Provider statistics:");
        spdlog::info("  connections:         {}", stats_.connections.load());
        spdlog::info("  requests:            {}", stats_.requests.load());
        spdlog::info("  transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  transfers aborted:   {}", stats_.transfers_aborted.load());
        spdlog::info("  bytes sent:          {}", stats_.bytes_sent.load());
    }

private:
    Stats stats_;
};

} // namespace sendme::events
