#pragma once

#include "sendme/core/result.hpp"
#include "sendme/get/transfer_event.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sendme::get {

enum class TransferPhase {
    Connecting,
    Requesting,
    EnumeratingOrSingleItem,
    ReceivingCollection,
    ReceivingSingleItem,
    Finished,
    Aborted
};

const char* phase_name(TransferPhase phase);

/**
 * @brief One progress indicator: hidden, or a position out of a length
 */
struct Counter {
    bool visible = false;
    std::uint64_t position = 0;
    std::uint64_t length = 0;

    bool operator==(const Counter& other) const {
        return visible == other.visible && position == other.position && length == other.length;
    }
};

struct TransferSummary {
    std::uint64_t total_bytes = 0;
    std::chrono::nanoseconds elapsed{0};
    std::uint64_t bytes_per_second = 0;
};

/**
 * @brief Display state derived from the events seen so far
 *
 * In ReceivingCollection, overall.position/overall.length is "item index of
 * item count"; current tracks the bytes of the item being received.
 */
struct ProgressState {
    TransferPhase phase = TransferPhase::Connecting;
    Counter overall;
    Counter current;
    std::optional<TransferSummary> summary;    ///< Set on Finished
    std::optional<std::string> abort_cause;    ///< Set on Aborted
};

/**
 * @brief Pure state machine turning a transfer event stream into UI state
 *
 * Performs no I/O apart from logging protocol violations. Events that do
 * not fit the current state are recorded as ProtocolViolation and otherwise
 * ignored; the reducer never fails on them.
 */
class TransferProgressReducer {
public:
    /// Apply one event and return the resulting state.
    const ProgressState& apply(const TransferEvent& event);

    [[nodiscard]] const ProgressState& state() const noexcept { return state_; }
    [[nodiscard]] bool terminal() const noexcept;
    [[nodiscard]] const std::vector<Error>& violations() const noexcept { return violations_; }

    /**
     * @brief Final result of the transfer
     *
     * The summary once Finished; TransferAborted when aborted or when the
     * stream ended before a terminal event.
     */
    [[nodiscard]] Result<TransferSummary> outcome() const;

    /// Feed a literal event sequence; returns the initial state followed by
    /// the state after each event.
    static std::vector<ProgressState> reduce(const std::vector<TransferEvent>& events);

    static std::uint64_t throughput(std::uint64_t total_bytes, std::chrono::nanoseconds elapsed);

private:
    void on(const Connected& event);
    void on(const RequestSent& event);
    void on(const CollectionDiscovered& event);
    void on(const ItemStarted& event);
    void on(const ItemProgress& event);
    void on(const ItemDone& event);
    void on(const TransferDone& event);
    void on(const Aborted& event);
    void on(const UnknownEvent& event);

    void violation(std::string message);

    ProgressState state_;
    bool collection_ = false;
    std::optional<std::uint64_t> active_item_;
    std::vector<Error> violations_;
};

} // namespace sendme::get
