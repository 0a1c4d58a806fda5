#pragma once

#include "sbridge/core/result.hpp"
#include "sbridge/events/event_bus.hpp"
#include "sbridge/link/link.hpp"
#include "sbridge/link/link_turn.hpp"
#include "sbridge/transfer/types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sbridge::config {
struct BridgeConfig;
}

namespace sbridge::session {

enum class Mode {
    Send,
    Receive,
    Both
};

/// Parses "send", "recv"/"receive" and "both"
Result<Mode> parse_mode(const std::string& text);
const char* to_string(Mode mode);

/**
 * @brief Per-file outcome of a batch send
 */
struct FileOutcome {
    std::filesystem::path path;
    Result<transfer::TransferReport> result;
};

struct BatchReport {
    std::vector<FileOutcome> files;

    std::size_t succeeded() const;
    std::size_t failed() const;
};

/**
 * @brief Owns the link and supervises both transfer roles on it
 *
 * - Sending runs synchronously on the calling thread, one file at a time
 * - Receiving runs the accept loop on a background thread until
 *   stop_receiving() or destruction
 * - When both run, a LinkTurn keeps each engine's request/reply pairs
 *   apart: the sender takes the turn for a whole file, the receiver between
 *   its bounded scan reads and for a whole incoming file
 *
 * Known limitation: a header the remote peer sends while the local sender
 * holds the turn is consumed as a bad reply by the sender. The remote's
 * handshake retries usually land once the turn is released.
 */
class SessionCoordinator {
public:
    SessionCoordinator(std::unique_ptr<link::Link> link,
                       events::EventBus& bus,
                       transfer::TransferOptions options = {});
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /**
     * @brief Open the serial device named by the configuration
     *
     * @return LinkOpenFailure when the device cannot be opened
     */
    static Result<std::unique_ptr<SessionCoordinator>> open(const config::BridgeConfig& config,
                                                            events::EventBus& bus);

    /**
     * @brief Start the background accept loop
     *
     * @return InvalidArgument if already receiving or if the link reads
     *         without a timeout (the loop could never observe a stop request)
     */
    Result<void> start_receiving(const std::filesystem::path& output_dir);

    /// Signal the accept loop and join it; returns within about one read timeout
    void stop_receiving();

    bool is_receiving() const noexcept { return receiver_thread_.joinable() && !receiver_finished_.load(); }

    /**
     * @brief How the last accept loop ended
     *
     * Ok while the loop runs, after a requested stop, or if it never ran.
     * LinkClosed when the link was lost underneath it.
     */
    Result<void> receiver_result() const;

    /// Send one file; holds the link turn for the whole exchange
    Result<transfer::TransferReport> send_file(const std::filesystem::path& path);

    /// Send every non-blank entry in order; a failed file never stops the batch
    BatchReport send_files(const std::vector<std::string>& paths);

    link::Link& link() noexcept { return *link_; }
    const transfer::TransferOptions& options() const noexcept { return options_; }

private:
    std::unique_ptr<link::Link> link_;
    events::EventBus& bus_;
    transfer::TransferOptions options_;

    link::LinkTurn link_turn_;

    std::thread receiver_thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> receiver_finished_{false};

    mutable std::mutex result_mutex_;
    Result<void> receiver_result_;
};

} // namespace sbridge::session
