#include "sbridge/events/event_bus.hpp"
#include "sbridge/events/events.hpp"
#include "sbridge/link/memory_link.hpp"
#include "sbridge/session/coordinator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace sbridge;
using namespace std::chrono_literals;
using session::Mode;
using session::SessionCoordinator;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("sbridge_coordinator_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

fs::path write_file(const fs::path& dir, const std::string& name, const std::string& content) {
    const fs::path path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

transfer::TransferOptions fast_options() {
    transfer::TransferOptions options;
    options.handshake_backoff = 20ms;
    options.chunk_backoff = 5ms;
    options.chunk_size = 1024;
    options.stall_timeout = 2000ms;
    return options;
}

/// Counts completed receptions published on a bus
class ReceiveCounter {
public:
    explicit ReceiveCounter(events::EventBus& bus) {
        bus.subscribe<events::TransferCompletedEvent>([this](const events::TransferCompletedEvent& e) {
            if (e.report.direction == transfer::Direction::Receive) {
                count_++;
            }
        });
    }

    bool wait_for(int expected, std::chrono::milliseconds timeout = 5000ms) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (count_.load() < expected) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

private:
    std::atomic<int> count_{0};
};

} // namespace

TEST(ParseModeTest, AcceptsKnownModes) {
    EXPECT_EQ(session::parse_mode("send").value(), Mode::Send);
    EXPECT_EQ(session::parse_mode(" RECV ").value(), Mode::Receive);
    EXPECT_EQ(session::parse_mode("receive").value(), Mode::Receive);
    EXPECT_EQ(session::parse_mode("Both").value(), Mode::Both);

    auto invalid = session::parse_mode("upload");
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);
}

TEST(SessionCoordinatorTest, SendsFileToListeningPeer) {
    const auto source_dir = create_temp_dir();
    const auto output_dir = create_temp_dir();
    const std::string content(5000, 'q');
    const auto file = write_file(source_dir, "payload.bin", content);

    auto links = link::make_memory_link_pair(100ms);
    events::EventBus receiver_bus;
    events::EventBus sender_bus;
    ReceiveCounter received(receiver_bus);

    SessionCoordinator receiver(std::move(links.first), receiver_bus, fast_options());
    SessionCoordinator sender(std::move(links.second), sender_bus, fast_options());

    ASSERT_TRUE(receiver.start_receiving(output_dir).is_ok());
    EXPECT_TRUE(receiver.is_receiving());

    auto sent = sender.send_file(file);
    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    EXPECT_EQ(sent.value().chunks, 5u);

    ASSERT_TRUE(received.wait_for(1));
    EXPECT_EQ(read_file(output_dir / "payload.bin"), content);

    receiver.stop_receiving();
    EXPECT_FALSE(receiver.is_receiving());
}

TEST(SessionCoordinatorTest, StopWhileIdleExitsPromptlyWithoutFiles) {
    const auto output_dir = create_temp_dir();
    auto links = link::make_memory_link_pair(200ms);
    events::EventBus bus;

    std::atomic<int> stopped{0};
    bus.subscribe<events::ReceiverStoppedEvent>([&](const events::ReceiverStoppedEvent&) { stopped++; });

    SessionCoordinator coordinator(std::move(links.first), bus, fast_options());
    ASSERT_TRUE(coordinator.start_receiving(output_dir).is_ok());
    std::this_thread::sleep_for(300ms);

    const auto start = std::chrono::steady_clock::now();
    coordinator.stop_receiving();
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_LT(waited, 1000ms);
    EXPECT_FALSE(coordinator.is_receiving());
    EXPECT_TRUE(fs::is_empty(output_dir));
    EXPECT_EQ(stopped.load(), 1);
}

TEST(SessionCoordinatorTest, RefusesSecondReceiverAndUnboundedReads) {
    const auto output_dir = create_temp_dir();
    events::EventBus bus;

    auto bounded = link::make_memory_link_pair(100ms);
    SessionCoordinator coordinator(std::move(bounded.first), bus, fast_options());
    ASSERT_TRUE(coordinator.start_receiving(output_dir).is_ok());
    auto again = coordinator.start_receiving(output_dir);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidArgument);
    coordinator.stop_receiving();

    // Restart after a stop is allowed
    EXPECT_TRUE(coordinator.start_receiving(output_dir).is_ok());
    coordinator.stop_receiving();

    auto unbounded = link::make_memory_link_pair(0ms);
    SessionCoordinator blocking(std::move(unbounded.first), bus, fast_options());
    auto refused = blocking.start_receiving(output_dir);
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().code, ErrorCode::InvalidArgument);
}

TEST(SessionCoordinatorTest, BatchContinuesPastMissingFile) {
    const auto source_dir = create_temp_dir();
    const auto output_dir = create_temp_dir();
    const auto first = write_file(source_dir, "first.txt", "first file");
    const auto second = write_file(source_dir, "second.txt", "second file");

    auto links = link::make_memory_link_pair(100ms);
    events::EventBus receiver_bus;
    events::EventBus sender_bus;
    ReceiveCounter received(receiver_bus);

    SessionCoordinator receiver(std::move(links.first), receiver_bus, fast_options());
    SessionCoordinator sender(std::move(links.second), sender_bus, fast_options());
    ASSERT_TRUE(receiver.start_receiving(output_dir).is_ok());

    const std::vector<std::string> batch{
        first.string(), "   ", (source_dir / "missing.txt").string(), second.string()};
    auto report = sender.send_files(batch);

    ASSERT_EQ(report.files.size(), 3u);
    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(report.failed(), 1u);
    ASSERT_TRUE(report.files[1].result.is_error());
    EXPECT_EQ(report.files[1].result.error().code, ErrorCode::FileError);

    ASSERT_TRUE(received.wait_for(2));
    EXPECT_EQ(read_file(output_dir / "first.txt"), "first file");
    EXPECT_EQ(read_file(output_dir / "second.txt"), "second file");
    EXPECT_FALSE(fs::exists(output_dir / "missing.txt"));
}

TEST(SessionCoordinatorTest, BothModeSendsAndReceivesOnOneLink) {
    const auto left_dir = create_temp_dir();
    const auto right_dir = create_temp_dir();
    const auto left_file = write_file(left_dir, "from_left.txt", std::string(3000, 'L'));
    const auto right_file = write_file(right_dir, "from_right.txt", std::string(2500, 'R'));
    const auto left_out = left_dir / "inbox";
    const auto right_out = right_dir / "inbox";

    auto links = link::make_memory_link_pair(100ms);
    events::EventBus left_bus;
    events::EventBus right_bus;
    ReceiveCounter left_received(left_bus);
    ReceiveCounter right_received(right_bus);

    SessionCoordinator left(std::move(links.first), left_bus, fast_options());
    SessionCoordinator right(std::move(links.second), right_bus, fast_options());
    ASSERT_TRUE(left.start_receiving(left_out).is_ok());
    ASSERT_TRUE(right.start_receiving(right_out).is_ok());

    auto sent_left = left.send_file(left_file);
    ASSERT_TRUE(sent_left.is_ok()) << sent_left.error().describe();
    ASSERT_TRUE(right_received.wait_for(1));

    auto sent_right = right.send_file(right_file);
    ASSERT_TRUE(sent_right.is_ok()) << sent_right.error().describe();
    ASSERT_TRUE(left_received.wait_for(1));

    EXPECT_EQ(read_file(right_out / "from_left.txt"), std::string(3000, 'L'));
    EXPECT_EQ(read_file(left_out / "from_right.txt"), std::string(2500, 'R'));
}

TEST(SessionCoordinatorTest, SendWithoutListenerTimesOutHandshake) {
    const auto source_dir = create_temp_dir();
    const auto file = write_file(source_dir, "lonely.txt", "nobody home");

    auto links = link::make_memory_link_pair(20ms);
    events::EventBus bus;

    auto options = fast_options();
    options.handshake_retries = 3;
    options.handshake_backoff = 1ms;
    SessionCoordinator sender(std::move(links.second), bus, options);

    auto result = sender.send_file(file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::HandshakeTimeout);
}

TEST(SessionCoordinatorTest, LostLinkEndsReceiverWithLinkClosed) {
    const auto output_dir = create_temp_dir();
    auto links = link::make_memory_link_pair(50ms);
    events::EventBus bus;

    SessionCoordinator coordinator(std::move(links.first), bus, fast_options());
    ASSERT_TRUE(coordinator.start_receiving(output_dir).is_ok());
    EXPECT_TRUE(coordinator.receiver_result().is_ok());

    // Unplugging the adapter closes both directions
    links.second->close();

    const auto deadline = std::chrono::steady_clock::now() + 3000ms;
    while (coordinator.is_receiving() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(coordinator.is_receiving());

    auto ended = coordinator.receiver_result();
    ASSERT_TRUE(ended.is_error());
    EXPECT_EQ(ended.error().code, ErrorCode::LinkClosed);

    coordinator.stop_receiving();
    EXPECT_TRUE(coordinator.receiver_result().is_error());
}

TEST(SessionCoordinatorTest, RequestedStopLeavesReceiverResultOk) {
    const auto output_dir = create_temp_dir();
    auto links = link::make_memory_link_pair(50ms);
    events::EventBus bus;

    SessionCoordinator coordinator(std::move(links.first), bus, fast_options());
    ASSERT_TRUE(coordinator.start_receiving(output_dir).is_ok());
    coordinator.stop_receiving();

    EXPECT_TRUE(coordinator.receiver_result().is_ok());
}
