#include <gtest/gtest.h>
#include "sbridge/events/event_bus.hpp"
#include "sbridge/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sbridge::events;
using sbridge::transfer::Direction;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint32_t received_seq = 0;

    bus.subscribe<ChunkAcknowledgedEvent>([&](const ChunkAcknowledgedEvent& e) {
        handler_called = true;
        received_seq = e.seq;
    });

    bus.emit(ChunkAcknowledgedEvent{Direction::Send, "a.bin", 42, 4096, 1});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_seq, 42u);
}

TEST(EventBus, DeliversOnlyToMatchingType) {
    EventBus bus;

    int acked = 0;
    int duplicates = 0;

    bus.subscribe<ChunkAcknowledgedEvent>([&](const ChunkAcknowledgedEvent&) { acked++; });
    bus.subscribe<DuplicateChunkEvent>([&](const DuplicateChunkEvent&) { duplicates++; });

    bus.emit(ChunkAcknowledgedEvent{Direction::Send, "a.bin", 0, 10, 1});
    bus.emit(DuplicateChunkEvent{"a.bin", 0});
    bus.emit(ChunkAcknowledgedEvent{Direction::Send, "a.bin", 1, 10, 1});

    EXPECT_EQ(acked, 2);
    EXPECT_EQ(duplicates, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<ReceiverStoppedEvent>([&](const ReceiverStoppedEvent&) { count++; });

    bus.emit(ReceiverStoppedEvent{"first"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<ReceiverStoppedEvent>(id);

    bus.emit(ReceiverStoppedEvent{"second"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(ReceiverStoppedEvent{"nobody listening"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopDelivery) {
    EventBus bus;

    int later_calls = 0;
    bus.subscribe<DuplicateChunkEvent>([](const DuplicateChunkEvent&) {
        throw std::runtime_error("presentation failed");
    });
    bus.subscribe<DuplicateChunkEvent>([&](const DuplicateChunkEvent&) { later_calls++; });

    EXPECT_NO_THROW(bus.emit(DuplicateChunkEvent{"a.bin", 3}));
    EXPECT_EQ(later_calls, 1);
}

TEST(EventBus, ConcurrentEmitFromBothDirections) {
    EventBus bus;
    std::atomic<int> sent{0};
    std::atomic<int> received{0};

    bus.subscribe<ChunkAcknowledgedEvent>([&](const ChunkAcknowledgedEvent& e) {
        if (e.direction == Direction::Send) {
            sent++;
        } else {
            received++;
        }
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus, i]() {
            const auto direction = i % 2 == 0 ? Direction::Send : Direction::Receive;
            bus.emit(ChunkAcknowledgedEvent{direction, "a.bin", static_cast<std::uint32_t>(i), 1, 1});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(sent.load(), 25);
    EXPECT_EQ(received.load(), 25);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<ReceiverStartedEvent>(), 0u);

    auto id = bus.subscribe<ReceiverStartedEvent>([](const ReceiverStartedEvent&) {});
    bus.subscribe<ReceiverStartedEvent>([](const ReceiverStartedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ReceiverStartedEvent>(), 2u);

    bus.unsubscribe<ReceiverStartedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<ReceiverStartedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<ReceiverStartedEvent>(), 0u);
}
