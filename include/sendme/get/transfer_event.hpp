#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace sendme::get {

// ════════════════════════════════════════════════════════
// Transfer Events
//
// Emitted by the getter while a download runs, consumed exactly once and in
// order by TransferProgressReducer.
// ════════════════════════════════════════════════════════

/// Transport session established with the provider.
struct Connected {};

/// Request written; the reply will tell whether the root is a collection.
struct RequestSent {};

/// The root is a hash sequence of @c item_count blobs.
struct CollectionDiscovered {
    std::uint64_t item_count = 0;
};

struct ItemStarted {
    std::uint64_t index = 0;
    std::uint64_t declared_size = 0;
};

struct ItemProgress {
    std::uint64_t index = 0;
    std::uint64_t bytes_so_far = 0;
};

struct ItemDone {
    std::uint64_t index = 0;
};

struct TransferDone {
    std::uint64_t total_bytes = 0;
    std::chrono::nanoseconds elapsed{0};
};

struct Aborted {
    std::string cause;
};

/// Placeholder for event kinds introduced by a newer producer.
struct UnknownEvent {
    std::string kind;
};

using TransferEvent = std::variant<Connected,
                                   RequestSent,
                                   CollectionDiscovered,
                                   ItemStarted,
                                   ItemProgress,
                                   ItemDone,
                                   TransferDone,
                                   Aborted,
                                   UnknownEvent>;

std::string describe(const TransferEvent& event);

} // namespace sendme::get
