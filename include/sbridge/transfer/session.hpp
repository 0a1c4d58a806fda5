#pragma once

#include "sbridge/core/result.hpp"
#include "sbridge/transfer/types.hpp"

#include <chrono>
#include <string>

namespace sbridge::transfer {

/**
 * @brief State and accounting of one file moving in one direction
 *
 * Idle -> Handshake -> Transferring -> Complete, with Failed reachable from
 * any non-terminal state. Retries inside Transferring never change state.
 */
class TransferSession {
public:
    TransferSession(Direction direction, std::string file_name, std::uint64_t total_size);

    [[nodiscard]] const std::string& file_name() const noexcept { return info_.file_name; }
    [[nodiscard]] TransferState state() const noexcept { return info_.state; }
    [[nodiscard]] std::uint32_t next_seq() const noexcept { return info_.next_seq; }
    [[nodiscard]] std::uint64_t bytes_transferred() const noexcept { return info_.bytes_transferred; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }

    Result<void> begin_handshake();

    /// Enters Transferring and restarts the clock used for throughput
    Result<void> start_transfer();

    /// Account one persisted or acknowledged chunk; the sequence wraps at 2^32
    Result<void> record_chunk(std::size_t length);

    Result<void> complete();
    Result<void> mark_failed(std::string error_message);
    Result<void> transition_to(TransferState next_state);

    [[nodiscard]] ProgressSample progress() const;
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferInfo info_;
};

} // namespace sbridge::transfer
