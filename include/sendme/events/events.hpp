/**
 * @file events.hpp
 * @brief Provider lifecycle events published on the EventBus
 *
 * NAMING CONVENTION:
 * Events are past-tense facts about a connection: ClientConnectedEvent,
 * TransferCompletedEvent. connection_id is assigned by the Provider and is
 * unique for the lifetime of the process.
 */

#pragma once

#include "sendme/store/hash.hpp"
#include "sendme/store/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace sendme::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ProviderStartedEvent {
    std::string address;
    uint16_t port;
};

struct ProviderShuttingDownEvent {
    std::string reason;
};

// ════════════════════════════════════════════════════════
// Connection Events
// ════════════════════════════════════════════════════════

/**
 * @brief A getter opened a TCP connection and received our hello frame
 *
 * WHO EMITS: Provider connection, right after the hello is written
 * WHO SUBSCRIBES: LoggerComponent, StatsComponent
 */
struct ClientConnectedEvent {
    uint64_t connection_id;
    std::string remote;
};

/**
 * @brief A well-formed request was decoded from a connection
 */
struct RequestReceivedEvent {
    uint64_t connection_id;
    enum class Kind : uint8_t { Sizes, Get } kind;
    store::Hash hash;
    store::BlobFormat format;
};

/**
 * @brief Every frame of a get request has been written
 */
struct TransferCompletedEvent {
    uint64_t connection_id;
    store::Hash hash;
    uint64_t blobs_sent;
    uint64_t bytes_sent;
    std::chrono::nanoseconds elapsed;
};

/**
 * @brief A connection ended before its request was fully served
 *
 * Covers peer disconnects, malformed requests and unknown hashes.
 */
struct TransferAbortedEvent {
    uint64_t connection_id;
    std::string reason;
};

} // namespace sendme::events
