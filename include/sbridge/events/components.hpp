/**
 * @file components.hpp
 * @brief Event subscribers shipped with the library
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Engines publish, components react.
 */

#pragma once

#include "sbridge/events/event_bus.hpp"
#include "sbridge/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstdint>

namespace sbridge::events {

/**
 * @brief Logs transfer milestones through spdlog
 *
 * Milestones (start, completion, failure) at info/error, per-chunk detail at
 * debug. Progress samples are left to the presentation layer.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });

        bus_.subscribe<ChunkAcknowledgedEvent>([](const ChunkAcknowledgedEvent& e) {
            spdlog::debug("[{}] {} seq={} len={} attempts={}",
                          to_string(e.direction), e.file_name, e.seq, e.length, e.attempts);
        });

        bus_.subscribe<ChunkRejectedEvent>([](const ChunkRejectedEvent& e) {
            spdlog::debug("[{}] {} seq={} rejected: {} {}",
                          to_string(e.direction), e.file_name, e.seq, to_string(e.reason), e.detail);
        });

        bus_.subscribe<DuplicateChunkEvent>([](const DuplicateChunkEvent& e) {
            spdlog::debug("[recv] {} seq={} already written, re-acknowledged", e.file_name, e.seq);
        });

        bus_.subscribe<ReceiverStartedEvent>([](const ReceiverStartedEvent& e) {
            spdlog::info("[recv] Listening on {}. Saving to {}", e.link, e.output_dir.string());
        });

        bus_.subscribe<ReceiverStoppedEvent>([](const ReceiverStoppedEvent& e) {
            spdlog::info("[recv] Stopped: {}", e.reason);
        });
    }

private:
    void on_transfer_started(const TransferStartedEvent& e) {
        if (e.direction == Direction::Send) {
            spdlog::info("[send] Handshake OK after {} attempt(s): {} ({} bytes)",
                         e.handshake_attempts, e.file_name, e.total_bytes);
        } else {
            spdlog::info("[recv] Incoming: {} ({} bytes) -> {}",
                         e.file_name, e.total_bytes, e.path.string());
        }
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        const auto& r = e.report;
        const double seconds = std::max(0.001, r.duration.count() / 1000.0);
        spdlog::info("[{}] Complete: {} ({} bytes, {} chunks, {} retries) @ {:.2f} KB/s",
                     to_string(r.direction), r.file_name, r.bytes_transferred, r.chunks,
                     r.retries, static_cast<double>(r.bytes_transferred) / 1024.0 / seconds);
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        spdlog::error("[{}] Failed: {} after {} bytes: {}",
                      to_string(e.direction), e.file_name, e.bytes_transferred, e.error.describe());
    }

    EventBus& bus_;
};

/**
 * @brief Counters over every transfer seen on the bus
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> files_sent{0};
        std::atomic<std::uint64_t> bytes_sent{0};
        std::atomic<std::uint64_t> files_received{0};
        std::atomic<std::uint64_t> bytes_received{0};
        std::atomic<std::uint64_t> send_failures{0};
        std::atomic<std::uint64_t> receive_failures{0};
        std::atomic<std::uint64_t> chunks_retried{0};   ///< Sender-side rejected attempts
        std::atomic<std::uint64_t> naks_sent{0};        ///< Receiver-side rejected chunks
        std::atomic<std::uint64_t> duplicate_chunks{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            if (e.direction == Direction::Send) {
                stats_.send_failures++;
            } else {
                stats_.receive_failures++;
            }
        });

        bus_.subscribe<ChunkRejectedEvent>([this](const ChunkRejectedEvent& e) {
            if (e.direction == Direction::Send) {
                stats_.chunks_retried++;
            } else {
                stats_.naks_sent++;
            }
        });

        bus_.subscribe<DuplicateChunkEvent>([this](const DuplicateChunkEvent&) {
            stats_.duplicate_chunks++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Link Statistics:");
        spdlog::info("  Files sent:      {}", stats_.files_sent.load());
        spdlog::info("  Bytes sent:      {}", stats_.bytes_sent.load());
        spdlog::info("  Files received:  {}", stats_.files_received.load());
        spdlog::info("  Bytes received:  {}", stats_.bytes_received.load());
        spdlog::info("  Send failures:   {}", stats_.send_failures.load());
        spdlog::info("  Recv failures:   {}", stats_.receive_failures.load());
        spdlog::info("  Chunk retries:   {}", stats_.chunks_retried.load());
        spdlog::info("  NAKs sent:       {}", stats_.naks_sent.load());
        spdlog::info("  Duplicates:      {}", stats_.duplicate_chunks.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_transfer_completed(const TransferCompletedEvent& e) {
        if (e.report.direction == Direction::Send) {
            stats_.files_sent++;
            stats_.bytes_sent += e.report.bytes_transferred;
        } else {
            stats_.files_received++;
            stats_.bytes_received += e.report.bytes_transferred;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace sbridge::events
