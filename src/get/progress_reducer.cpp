#include "sendme/get/progress_reducer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace sendme::get {

namespace {

// Transfers shorter than this are reported as if they took this long.
constexpr std::chrono::nanoseconds kMinElapsed = std::chrono::milliseconds(1);

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string describe(const TransferEvent& event) {
    return std::visit(Overloaded{
        [](const Connected&) { return std::string("Connected"); },
        [](const RequestSent&) { return std::string("RequestSent"); },
        [](const CollectionDiscovered& e) {
            return "CollectionDiscovered{" + std::to_string(e.item_count) + "}";
        },
        [](const ItemStarted& e) {
            return "ItemStarted{" + std::to_string(e.index) + ", " + std::to_string(e.declared_size) + "}";
        },
        [](const ItemProgress& e) {
            return "ItemProgress{" + std::to_string(e.index) + ", " + std::to_string(e.bytes_so_far) + "}";
        },
        [](const ItemDone& e) { return "ItemDone{" + std::to_string(e.index) + "}"; },
        [](const TransferDone& e) {
            return "TransferDone{" + std::to_string(e.total_bytes) + ", " +
                   std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(e.elapsed).count()) + "ms}";
        },
        [](const Aborted& e) { return "Aborted{" + e.cause + "}"; },
        [](const UnknownEvent& e) { return "Unknown{" + e.kind + "}"; },
    }, event);
}

const char* phase_name(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Connecting: return "connecting";
        case TransferPhase::Requesting: return "requesting";
        case TransferPhase::EnumeratingOrSingleItem: return "enumerating";
        case TransferPhase::ReceivingCollection: return "receiving collection";
        case TransferPhase::ReceivingSingleItem: return "receiving single item";
        case TransferPhase::Finished: return "finished";
        case TransferPhase::Aborted: return "aborted";
    }
    return "unknown";
}

bool TransferProgressReducer::terminal() const noexcept {
    return state_.phase == TransferPhase::Finished || state_.phase == TransferPhase::Aborted;
}

const ProgressState& TransferProgressReducer::apply(const TransferEvent& event) {
    if (terminal()) {
        violation(describe(event) + " received after the transfer " + phase_name(state_.phase));
        return state_;
    }
    std::visit([this](const auto& e) { on(e); }, event);
    return state_;
}

std::vector<ProgressState> TransferProgressReducer::reduce(const std::vector<TransferEvent>& events) {
    TransferProgressReducer reducer;
    std::vector<ProgressState> states;
    states.reserve(events.size() + 1);
    states.push_back(reducer.state());
    for (const auto& event : events) {
        states.push_back(reducer.apply(event));
    }
    return states;
}

std::uint64_t TransferProgressReducer::throughput(std::uint64_t total_bytes, std::chrono::nanoseconds elapsed) {
    const auto effective = std::max(elapsed, kMinElapsed);
    const double seconds = std::chrono::duration<double>(effective).count();
    const double rate = static_cast<double>(total_bytes) / seconds;
    // 2^64 is exactly representable; anything at or above it saturates
    constexpr double kLimit = static_cast<double>(std::numeric_limits<std::uint64_t>::max());
    if (rate >= kLimit) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return static_cast<std::uint64_t>(rate);
}

Result<TransferSummary> TransferProgressReducer::outcome() const {
    switch (state_.phase) {
        case TransferPhase::Finished:
            return Ok(*state_.summary);
        case TransferPhase::Aborted:
            return Err<TransferSummary>(ErrorKind::TransferAborted,
                                        "download aborted: " + state_.abort_cause.value_or("unknown cause"));
        default:
            return Err<TransferSummary>(ErrorKind::TransferAborted,
                                        std::string("download ended while ") + phase_name(state_.phase));
    }
}

void TransferProgressReducer::violation(std::string message) {
    spdlog::warn("Transfer protocol violation: {}", message);
    violations_.emplace_back(ErrorKind::ProtocolViolation, std::move(message));
}

void TransferProgressReducer::on(const Connected&) {
    if (state_.phase != TransferPhase::Connecting) {
        violation(std::string("Connected while ") + phase_name(state_.phase));
        return;
    }
    state_.phase = TransferPhase::Requesting;
}

void TransferProgressReducer::on(const RequestSent&) {
    if (state_.phase != TransferPhase::Requesting) {
        violation(std::string("RequestSent while ") + phase_name(state_.phase));
        return;
    }
    state_.phase = TransferPhase::EnumeratingOrSingleItem;
}

void TransferProgressReducer::on(const CollectionDiscovered& event) {
    if (state_.phase != TransferPhase::Requesting &&
        state_.phase != TransferPhase::EnumeratingOrSingleItem) {
        violation(std::string("CollectionDiscovered while ") + phase_name(state_.phase));
        return;
    }
    collection_ = true;
    state_.phase = TransferPhase::ReceivingCollection;
    state_.overall = Counter{true, 0, event.item_count};
}

void TransferProgressReducer::on(const ItemStarted& event) {
    switch (state_.phase) {
        case TransferPhase::Requesting:
        case TransferPhase::EnumeratingOrSingleItem:
            // No collection announced: this is the only blob.
            state_.phase = TransferPhase::ReceivingSingleItem;
            state_.overall.visible = false;
            break;
        case TransferPhase::ReceivingCollection:
            if (event.index >= state_.overall.length) {
                violation("ItemStarted{" + std::to_string(event.index) + "} beyond collection of " +
                          std::to_string(state_.overall.length));
                return;
            }
            state_.overall.position = event.index;
            break;
        case TransferPhase::ReceivingSingleItem:
            if (active_item_ || event.index != 0) {
                violation("ItemStarted{" + std::to_string(event.index) + "} in a single-blob transfer");
                return;
            }
            break;
        default:
            violation(std::string("ItemStarted while ") + phase_name(state_.phase));
            return;
    }
    if (active_item_ && *active_item_ != event.index) {
        violation("ItemStarted{" + std::to_string(event.index) + "} before ItemDone{" +
                  std::to_string(*active_item_) + "}");
    }
    active_item_ = event.index;
    state_.current = Counter{true, 0, event.declared_size};
}

void TransferProgressReducer::on(const ItemProgress& event) {
    if (!active_item_ || *active_item_ != event.index) {
        violation("ItemProgress{" + std::to_string(event.index) + "} does not match the active item");
        return;
    }
    state_.current.position = event.bytes_so_far;
}

void TransferProgressReducer::on(const ItemDone& event) {
    if (!active_item_ || *active_item_ != event.index) {
        violation("ItemDone{" + std::to_string(event.index) + "} does not match the active item");
        return;
    }
    active_item_.reset();
    state_.current = Counter{};
    if (collection_) {
        state_.overall.position = event.index + 1;
    }
}

void TransferProgressReducer::on(const TransferDone& event) {
    state_.phase = TransferPhase::Finished;
    state_.overall.visible = false;
    state_.current = Counter{};
    active_item_.reset();
    state_.summary = TransferSummary{event.total_bytes, event.elapsed,
                                     throughput(event.total_bytes, event.elapsed)};
}

void TransferProgressReducer::on(const Aborted& event) {
    state_.phase = TransferPhase::Aborted;
    state_.overall.visible = false;
    state_.current = Counter{};
    active_item_.reset();
    state_.abort_cause = event.cause;
}

void TransferProgressReducer::on(const UnknownEvent& event) {
    spdlog::debug("Ignoring unknown transfer event {}", event.kind);
}

} // namespace sendme::get
