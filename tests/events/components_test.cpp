#include "sendme/events/components.hpp"
#include "sendme/events/event_bus.hpp"
#include "sendme/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace sendme::events;
using sendme::store::BlobFormat;
using sendme::store::Hash;

TEST(StatsComponentTest, CountsProviderActivity) {
    EventBus bus;
    StatsComponent stats(bus);

    bus.emit(ClientConnectedEvent{1, "127.0.0.1:40000"});
    bus.emit(ClientConnectedEvent{2, "127.0.0.1:40001"});
    bus.emit(RequestReceivedEvent{1, RequestReceivedEvent::Kind::Sizes, Hash{}, BlobFormat::HashSeq});
    bus.emit(RequestReceivedEvent{1, RequestReceivedEvent::Kind::Get, Hash{}, BlobFormat::HashSeq});
    bus.emit(TransferCompletedEvent{1, Hash{}, 3, 4096, std::chrono::milliseconds{20}});
    bus.emit(TransferAbortedEvent{2, "connection reset"});

    const auto& counters = stats.get_stats();
    EXPECT_EQ(counters.connections.load(), 2u);
    EXPECT_EQ(counters.requests.load(), 2u);
    EXPECT_EQ(counters.transfers_completed.load(), 1u);
    EXPECT_EQ(counters.transfers_aborted.load(), 1u);
    EXPECT_EQ(counters.bytes_sent.load(), 4096u);
}

TEST(LoggerComponentTest, SubscribesToEveryProviderEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<ProviderStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ProviderShuttingDownEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ClientConnectedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<RequestReceivedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferAbortedEvent>(), 1u);

    EXPECT_NO_THROW(bus.emit(TransferCompletedEvent{1, Hash{}, 1, 1, std::chrono::nanoseconds{1}}));
}
