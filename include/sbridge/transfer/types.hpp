#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sbridge::transfer {

enum class Direction {
    Send,
    Receive
};

inline const char* to_string(Direction direction) {
    return direction == Direction::Send ? "send" : "recv";
}

enum class TransferState {
    Idle,
    Handshake,
    Transferring,
    Complete,
    Failed
};

/**
 * @brief Tunables shared by both engines
 */
struct TransferOptions {
    std::size_t chunk_size = 4096;                                 ///< Payload bytes per chunk, 1..65535
    unsigned int handshake_retries = 8;
    std::chrono::milliseconds handshake_backoff{150};
    unsigned int chunk_retries = 5;
    std::chrono::milliseconds chunk_backoff{50};
    std::chrono::milliseconds stall_timeout{30000};                ///< Receiver gives up on a silent body
};

/**
 * @brief Derived progress of one transfer
 */
struct ProgressSample {
    double percent = 0.0;
    double throughput_bytes_per_sec = 0.0;
    std::optional<double> eta_seconds;   ///< Unknown until some bytes moved
};

/**
 * @brief Live state of one file transfer in one direction
 */
struct TransferInfo {
    Direction direction = Direction::Send;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint32_t next_seq = 0;
    std::uint64_t bytes_transferred = 0;
    std::chrono::steady_clock::time_point started_at{};
    TransferState state = TransferState::Idle;
    std::string last_error; ///< Populated when state == Failed
};

/**
 * @brief Outcome of a completed transfer
 */
struct TransferReport {
    Direction direction = Direction::Send;
    std::string file_name;
    std::filesystem::path path;          ///< Source (send) or destination (receive)
    std::uint64_t total_size = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint32_t chunks = 0;
    std::uint32_t retries = 0;           ///< Extra attempts beyond one per chunk and handshake
    std::chrono::milliseconds duration{0};
};

} // namespace sbridge::transfer
