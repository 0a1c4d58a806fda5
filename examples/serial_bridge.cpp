/**
 * Serial Bridge command-line front end
 *
 * Usage:
 *   serial_bridge <send|recv|both> <port> [files...] [options]
 *
 * Options:
 *   --out DIR          Output directory for received files
 *   --config FILE      JSON configuration (see config.hpp)
 *   --baud N           Bit rate
 *   --timeout-ms N     Link read timeout in milliseconds
 *   --log-level L      trace, debug, info, warn, error, critical, off
 *
 * recv and both keep listening until Ctrl+C.
 */

#include "sbridge/config/config.hpp"
#include "sbridge/core/platform.hpp"
#include "sbridge/events/components.hpp"
#include "sbridge/events/event_bus.hpp"
#include "sbridge/events/events.hpp"
#include "sbridge/session/coordinator.hpp"
#include "sbridge/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace sbridge;

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_stop.store(true);
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <send|recv|both> <port> [files...] [options]\n"
              << "  --out DIR          Output directory for received files\n"
              << "  --config FILE      JSON configuration file\n"
              << "  --baud N           Bit rate (default 2000000)\n"
              << "  --timeout-ms N     Link read timeout in milliseconds (default 1000)\n"
              << "  --log-level L      trace|debug|info|warn|error|critical|off\n"
              << "Default port on " << platform_name() << ": " << default_serial_device() << "\n";
}

/**
 * @brief Renders TransferProgressEvent as one rewritten console line
 *
 * Sender and receiver may emit from different threads; the line belongs to
 * whichever file reported last.
 */
class ProgressPrinter {
public:
    explicit ProgressPrinter(events::EventBus& bus) {
        bus.subscribe<events::TransferStartedEvent>([this](const events::TransferStartedEvent& e) {
            std::lock_guard lock(mutex_);
            line_closed_[index(e.direction)] = false;
        });

        bus.subscribe<events::TransferProgressEvent>([this](const events::TransferProgressEvent& e) {
            std::lock_guard lock(mutex_);
            bool& closed = line_closed_[index(e.direction)];
            if (closed) {
                return;
            }
            std::cout << '\r' << '[' << transfer::to_string(e.direction) << "] "
                      << transfer::format_progress_line(e.bytes_transferred, e.total_bytes, e.sample)
                      << std::flush;
            if (e.bytes_transferred >= e.total_bytes) {
                std::cout << std::endl;
                closed = true;
            }
        });
    }

private:
    static std::size_t index(transfer::Direction direction) {
        return direction == transfer::Direction::Send ? 0 : 1;
    }

    std::mutex mutex_;
    bool line_closed_[2] = {false, false};
};

struct Arguments {
    session::Mode mode = session::Mode::Send;
    std::string port;
    std::vector<std::string> files;
    std::optional<std::string> config_path;
    std::optional<std::string> output_dir;
    std::optional<unsigned int> baud_rate;
    std::optional<long long> timeout_ms;
    std::optional<std::string> log_level;
};

Result<Arguments> parse_arguments(int argc, char* argv[]) {
    if (argc < 3) {
        return Err<Arguments>(ErrorCode::InvalidArgument, "mode and port are required");
    }

    Arguments args;
    auto mode = session::parse_mode(argv[1]);
    if (mode.is_error()) {
        return Err<Arguments>(mode.error());
    }
    args.mode = mode.value();
    args.port = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        try {
            if (arg == "--out" && has_value) {
                args.output_dir = argv[++i];
            } else if (arg == "--config" && has_value) {
                args.config_path = argv[++i];
            } else if (arg == "--baud" && has_value) {
                const long long baud = std::stoll(argv[++i]);
                if (baud <= 0 || baud > std::numeric_limits<unsigned int>::max()) {
                    return Err<Arguments>(ErrorCode::InvalidArgument, "--baud out of range: " + std::to_string(baud));
                }
                args.baud_rate = static_cast<unsigned int>(baud);
            } else if (arg == "--timeout-ms" && has_value) {
                args.timeout_ms = std::stoll(argv[++i]);
            } else if (arg == "--log-level" && has_value) {
                args.log_level = argv[++i];
            } else if (arg.rfind("--", 0) == 0) {
                return Err<Arguments>(ErrorCode::InvalidArgument, "unknown or incomplete option " + arg);
            } else {
                args.files.push_back(arg);
            }
        } catch (const std::logic_error&) {
            return Err<Arguments>(ErrorCode::InvalidArgument, "invalid number for " + arg);
        }
    }

    if (args.mode == session::Mode::Send && args.files.empty()) {
        return Err<Arguments>(ErrorCode::InvalidArgument, "send needs at least one file");
    }
    return Ok(std::move(args));
}

Result<config::BridgeConfig> resolve_config(const Arguments& args) {
    config::BridgeConfig config = config::default_config();
    if (args.config_path) {
        auto loaded = config::load_config(*args.config_path);
        if (loaded.is_error()) {
            return loaded;
        }
        config = loaded.value();
    }

    config.link.device = args.port;
    if (args.output_dir) config.output_dir = *args.output_dir;
    if (args.baud_rate) config.link.baud_rate = *args.baud_rate;
    if (args.timeout_ms) config.link.read_timeout = std::chrono::milliseconds(*args.timeout_ms);
    if (args.log_level) config.log_level = *args.log_level;

    if (auto valid = config::validate(config); valid.is_error()) {
        return Err<config::BridgeConfig>(valid.error());
    }
    return Ok(std::move(config));
}

/// Returns when Ctrl+C is pressed or the receiver ends on its own
void wait_for_interrupt(const session::SessionCoordinator& coordinator) {
    spdlog::info("Press Ctrl+C to stop");
    while (!g_stop.load() && coordinator.is_receiving()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_stop.load()) {
        spdlog::info("Interrupted, stopping receiver...");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto args = parse_arguments(argc, argv);
    if (args.is_error()) {
        spdlog::error("{}", args.error().message);
        print_usage(argv[0]);
        return 2;
    }

    auto config = resolve_config(args.value());
    if (config.is_error()) {
        spdlog::error("{}", config.error().describe());
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(config.value().log_level));

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);
    ProgressPrinter progress(bus);

    auto opened = session::SessionCoordinator::open(config.value(), bus);
    if (opened.is_error()) {
        spdlog::error("{}", opened.error().describe());
        return 1;
    }
    auto& coordinator = *opened.value();
    spdlog::info("Opened {} ({} mode)", coordinator.link().describe(), session::to_string(args.value().mode));

    std::signal(SIGINT, signal_handler);

    int exit_code = 0;
    const auto mode = args.value().mode;

    if (mode == session::Mode::Receive || mode == session::Mode::Both) {
        auto started = coordinator.start_receiving(config.value().output_dir);
        if (started.is_error()) {
            spdlog::error("{}", started.error().describe());
            return 1;
        }
    }

    if (mode == session::Mode::Send || mode == session::Mode::Both) {
        auto batch = coordinator.send_files(args.value().files);
        if (batch.failed() > 0) {
            exit_code = 1;
        }
    }

    if (mode == session::Mode::Receive || mode == session::Mode::Both) {
        wait_for_interrupt(coordinator);
        coordinator.stop_receiving();
        if (auto receiver = coordinator.receiver_result(); receiver.is_error()) {
            spdlog::error("Receiver stopped: {}", receiver.error().describe());
            exit_code = 1;
        }
    }

    metrics.print_stats();
    return exit_code;
}
