#include "sbridge/session/coordinator.hpp"
#include "sbridge/config/config.hpp"
#include "sbridge/link/serial_link.hpp"
#include "sbridge/transfer/receiver.hpp"
#include "sbridge/transfer/sender.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sbridge::session {
namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

Result<Mode> parse_mode(const std::string& text) {
    std::string lowered = trim(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "send") return Ok(Mode::Send);
    if (lowered == "recv" || lowered == "receive") return Ok(Mode::Receive);
    if (lowered == "both") return Ok(Mode::Both);
    return Err<Mode>(ErrorCode::InvalidArgument, "Invalid mode: " + text + " (expected send, recv or both)");
}

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::Send: return "send";
        case Mode::Receive: return "recv";
        case Mode::Both: return "both";
    }
    return "unknown";
}

std::size_t BatchReport::succeeded() const {
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
        [](const FileOutcome& outcome) { return outcome.result.is_ok(); }));
}

std::size_t BatchReport::failed() const {
    return files.size() - succeeded();
}

SessionCoordinator::SessionCoordinator(std::unique_ptr<link::Link> link,
                                       events::EventBus& bus,
                                       transfer::TransferOptions options)
    : link_(std::move(link))
    , bus_(bus)
    , options_(options) {
}

SessionCoordinator::~SessionCoordinator() {
    stop_receiving();
    if (link_) {
        link_->close();
    }
}

Result<std::unique_ptr<SessionCoordinator>> SessionCoordinator::open(const config::BridgeConfig& config,
                                                                     events::EventBus& bus) {
    auto serial = link::SerialLink::open(config.link.device, config.link.baud_rate, config.link.read_timeout);
    if (serial.is_error()) {
        return Err<std::unique_ptr<SessionCoordinator>>(serial.error());
    }
    return Ok(std::make_unique<SessionCoordinator>(std::move(serial.value()), bus, config.transfer));
}

Result<void> SessionCoordinator::start_receiving(const fs::path& output_dir) {
    if (receiver_thread_.joinable()) {
        if (!receiver_finished_.load()) {
            return Err<void>(ErrorCode::InvalidArgument, "Receiver already running");
        }
        receiver_thread_.join();
    }
    if (link_->read_timeout().count() <= 0) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Receiving needs a bounded read timeout so stop requests are observed");
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec && !fs::exists(output_dir)) {
        return Err<void>(ErrorCode::FileError,
                         "Failed to create directory " + output_dir.string() + ": " + ec.message());
    }

    stop_requested_.store(false);
    receiver_finished_.store(false);
    {
        std::lock_guard lock(result_mutex_);
        receiver_result_ = Ok();
    }
    receiver_thread_ = std::thread([this, output_dir]() {
        transfer::ReceiverEngine receiver(*link_, bus_, options_);
        auto result = receiver.accept_loop(output_dir, stop_requested_, &link_turn_);
        if (result.is_error()) {
            spdlog::error("[recv] Accept loop ended: {}", result.error().describe());
        }
        {
            std::lock_guard lock(result_mutex_);
            receiver_result_ = std::move(result);
        }
        receiver_finished_.store(true);
    });
    return Ok();
}

void SessionCoordinator::stop_receiving() {
    stop_requested_.store(true);
    if (receiver_thread_.joinable()) {
        receiver_thread_.join();
    }
}

Result<void> SessionCoordinator::receiver_result() const {
    std::lock_guard lock(result_mutex_);
    return receiver_result_;
}

Result<transfer::TransferReport> SessionCoordinator::send_file(const fs::path& path) {
    link::LinkTurn::PriorityGuard turn(link_turn_);
    transfer::SenderEngine sender(*link_, bus_, options_);
    return sender.send_file(path);
}

BatchReport SessionCoordinator::send_files(const std::vector<std::string>& paths) {
    BatchReport report;
    for (const auto& raw : paths) {
        const std::string entry = trim(raw);
        if (entry.empty()) {
            continue;
        }

        auto result = send_file(entry);
        if (result.is_error()) {
            spdlog::error("[send] {}: {}", entry, result.error().describe());
        }
        report.files.push_back(FileOutcome{entry, std::move(result)});
    }

    spdlog::info("[send] Batch finished: {} sent, {} failed", report.succeeded(), report.failed());
    return report;
}

} // namespace sbridge::session
