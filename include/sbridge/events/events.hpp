/**
 * @file events.hpp
 * @brief Event types published by the transfer engines and the coordinator
 *
 * WHY THIS FILE EXISTS:
 * Presentation layers (CLI progress bar, a GUI, metrics) subscribe to typed
 * events instead of parsing log text.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: TransferStartedEvent, ChunkRejectedEvent
 */

#pragma once

#include "sbridge/core/result.hpp"
#include "sbridge/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sbridge::events {

using transfer::Direction;

// ════════════════════════════════════════════════════════
// Transfer Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the header exchange succeeded and chunks start flowing
 *
 * WHO EMITS:
 * - Sender after "OK" arrived
 * - Receiver after the header was parsed and "OK" was written
 *
 * WHO SUBSCRIBES:
 * - Logger (file start milestone)
 * - CLI (resets the progress line)
 */
struct TransferStartedEvent {
    Direction direction;
    std::string file_name;
    std::uint64_t total_bytes;
    std::filesystem::path path;
    unsigned int handshake_attempts = 1;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted at least once per accepted chunk, and once at 100% on completion
 */
struct TransferProgressEvent {
    Direction direction;
    std::string file_name;
    std::uint64_t bytes_transferred;
    std::uint64_t total_bytes;
    transfer::ProgressSample sample;
};

/**
 * @brief Emitted when the "DONE" marker was sent (sender) or seen (receiver)
 */
struct TransferCompletedEvent {
    transfer::TransferReport report;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a file transfer ended without completing
 *
 * Fatal for that file only. A receiver-side failure leaves the partial
 * output file in place.
 */
struct TransferFailedEvent {
    Direction direction;
    std::string file_name;
    Error error;
    std::uint64_t bytes_transferred = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

struct ChunkAcknowledgedEvent {
    Direction direction;
    std::string file_name;
    std::uint32_t seq;
    std::size_t length;
    unsigned int attempts;   ///< Sender: transmissions needed; receiver: always 1
};

/**
 * @brief A chunk attempt that did not advance the transfer
 *
 * Sender: NAK, mismatched ACK, garbage or missing reply.
 * Receiver: checksum mismatch or truncated frame (a NAK was written).
 */
struct ChunkRejectedEvent {
    Direction direction;
    std::string file_name;
    std::uint32_t seq;
    ErrorCode reason;
    std::string detail;
};

/// Receiver saw a chunk it had already written and re-acknowledged it
struct DuplicateChunkEvent {
    std::string file_name;
    std::uint32_t seq;
};

// ════════════════════════════════════════════════════════
// Receiver Events
// ════════════════════════════════════════════════════════

struct ReceiverStartedEvent {
    std::string link;
    std::filesystem::path output_dir;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ReceiverStoppedEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace sbridge::events
