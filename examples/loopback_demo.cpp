/**
 * Loopback demo: both ends of the bridge in one process
 *
 * Usage:
 *   loopback_demo [file] [--out DIR]
 *
 * Two coordinators share an in-memory link pair. "left" receives, "right"
 * sends the given file (or a generated 64 KiB sample) and the demo waits for
 * the copy to land in the output directory.
 */

#include "sbridge/events/components.hpp"
#include "sbridge/events/event_bus.hpp"
#include "sbridge/events/events.hpp"
#include "sbridge/link/memory_link.hpp"
#include "sbridge/session/coordinator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

using namespace sbridge;
namespace fs = std::filesystem;

namespace {

fs::path write_sample(const fs::path& dir) {
    fs::create_directories(dir);
    const fs::path path = dir / "loopback_sample.bin";
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (std::size_t i = 0; i < 64 * 1024; ++i) {
        out.put(static_cast<char>((i * 31 + 7) & 0xFF));
    }
    return path;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path input;
    fs::path output_dir = fs::temp_directory_path() / "sbridge_loopback_out";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--out" && i + 1 < argc) {
            output_dir = fs::path(argv[++i]);
        } else {
            input = fs::path(arg);
        }
    }
    if (input.empty()) {
        input = write_sample(fs::temp_directory_path() / "sbridge_loopback_in");
    }

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Serial Bridge - Loopback Demo");
    spdlog::info("════════════════════════════════════════════");

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    std::mutex mutex;
    std::condition_variable cv;
    bool received = false;
    bus.subscribe<events::TransferCompletedEvent>([&](const events::TransferCompletedEvent& e) {
        if (e.report.direction == transfer::Direction::Receive) {
            {
                std::lock_guard lock(mutex);
                received = true;
            }
            cv.notify_all();
        }
    });

    auto [left_link, right_link] = link::make_memory_link_pair(std::chrono::milliseconds(200));

    transfer::TransferOptions options;
    options.stall_timeout = std::chrono::milliseconds(5000);

    session::SessionCoordinator left(std::move(left_link), bus, options);
    session::SessionCoordinator right(std::move(right_link), bus, options);

    auto started = left.start_receiving(output_dir);
    if (started.is_error()) {
        spdlog::error("{}", started.error().describe());
        return 1;
    }

    auto sent = right.send_file(input);
    if (sent.is_error()) {
        spdlog::error("{}", sent.error().describe());
        return 1;
    }

    {
        std::unique_lock lock(mutex);
        if (!cv.wait_for(lock, std::chrono::seconds(5), [&]() { return received; })) {
            spdlog::error("Receiver did not finish within 5 seconds");
            return 1;
        }
    }

    left.stop_receiving();

    const auto copy = output_dir / input.filename();
    std::error_code ec;
    const auto copied = fs::file_size(copy, ec);
    if (ec) {
        spdlog::error("Cannot stat {}: {}", copy.string(), ec.message());
        return 1;
    }
    spdlog::info("Copied {} -> {} ({} bytes)", input.string(), copy.string(), copied);
    metrics.print_stats();
    return 0;
}
