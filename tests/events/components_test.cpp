#include "sbridge/events/components.hpp"
#include "sbridge/events/event_bus.hpp"
#include "sbridge/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using sbridge::ErrorCode;
using sbridge::events::ChunkRejectedEvent;
using sbridge::events::DuplicateChunkEvent;
using sbridge::events::EventBus;
using sbridge::events::LoggerComponent;
using sbridge::events::MetricsComponent;
using sbridge::events::TransferCompletedEvent;
using sbridge::events::TransferFailedEvent;
using sbridge::events::TransferStartedEvent;
using sbridge::transfer::Direction;
using sbridge::transfer::TransferReport;

namespace {

TransferReport make_report(Direction direction, std::uint64_t bytes) {
    TransferReport report;
    report.direction = direction;
    report.file_name = "file.bin";
    report.total_size = bytes;
    report.bytes_transferred = bytes;
    report.chunks = 1;
    report.duration = std::chrono::milliseconds{200};
    return report;
}

} // namespace

TEST(MetricsComponentTest, TracksTransfersPerDirection) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(TransferCompletedEvent{make_report(Direction::Send, 1024)});
    bus.emit(TransferCompletedEvent{make_report(Direction::Send, 10)});
    bus.emit(TransferCompletedEvent{make_report(Direction::Receive, 2048)});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_sent.load(), 2u);
    EXPECT_EQ(stats.bytes_sent.load(), 1034u);
    EXPECT_EQ(stats.files_received.load(), 1u);
    EXPECT_EQ(stats.bytes_received.load(), 2048u);
}

TEST(MetricsComponentTest, CountsRejectionsFailuresAndDuplicates) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ChunkRejectedEvent{Direction::Send, "file.bin", 1, ErrorCode::ChecksumMismatch, "NAK seq=1"});
    bus.emit(ChunkRejectedEvent{Direction::Send, "file.bin", 1, ErrorCode::ShortRead, ""});
    bus.emit(ChunkRejectedEvent{Direction::Receive, "file.bin", 4, ErrorCode::ChecksumMismatch, "crc mismatch"});
    bus.emit(DuplicateChunkEvent{"file.bin", 3});
    bus.emit(TransferFailedEvent{Direction::Send, "file.bin", {ErrorCode::HandshakeTimeout, "no OK"}});
    bus.emit(TransferFailedEvent{Direction::Receive, "file.bin", {ErrorCode::TransferStalled, "silent"}, 4096});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.chunks_retried.load(), 2u);
    EXPECT_EQ(stats.naks_sent.load(), 1u);
    EXPECT_EQ(stats.duplicate_chunks.load(), 1u);
    EXPECT_EQ(stats.send_failures.load(), 1u);
    EXPECT_EQ(stats.receive_failures.load(), 1u);
    EXPECT_EQ(stats.files_sent.load(), 0u);
}

TEST(LoggerComponentTest, SubscribesToLifecycleEvents) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 1u);

    EXPECT_NO_THROW(bus.emit(TransferStartedEvent{Direction::Receive, "file.bin", 10, "out/file.bin"}));
    EXPECT_NO_THROW(bus.emit(TransferCompletedEvent{make_report(Direction::Receive, 10)}));
}
