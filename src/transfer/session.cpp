#include "sbridge/transfer/session.hpp"
#include "sbridge/transfer/progress.hpp"

namespace sbridge::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    if (target == TransferState::Failed) {
        return true;
    }

    switch (current) {
        case TransferState::Idle: return target == TransferState::Handshake;
        case TransferState::Handshake: return target == TransferState::Transferring;
        case TransferState::Transferring: return target == TransferState::Complete;
        default: return false;
    }
}

} // namespace

TransferSession::TransferSession(Direction direction, std::string file_name, std::uint64_t total_size) {
    info_.direction = direction;
    info_.file_name = std::move(file_name);
    info_.total_size = total_size;
    info_.state = TransferState::Idle;
    info_.started_at = std::chrono::steady_clock::now();
}

Result<void> TransferSession::begin_handshake() {
    if (info_.state != TransferState::Idle) {
        return Err<void>(ErrorCode::InvalidArgument, "Transfer already started");
    }
    return transition_to(TransferState::Handshake);
}

Result<void> TransferSession::start_transfer() {
    auto result = transition_to(TransferState::Transferring);
    if (result.is_ok()) {
        info_.started_at = std::chrono::steady_clock::now();
        info_.next_seq = 0;
        info_.bytes_transferred = 0;
    }
    return result;
}

Result<void> TransferSession::record_chunk(std::size_t length) {
    if (info_.state != TransferState::Transferring) {
        return Err<void>(ErrorCode::InvalidArgument, "Chunk recorded outside of transfer");
    }
    info_.bytes_transferred += length;
    ++info_.next_seq;
    return Ok();
}

Result<void> TransferSession::complete() {
    return transition_to(TransferState::Complete);
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(TransferState::Failed);
}

Result<void> TransferSession::transition_to(TransferState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidArgument, "Illegal transfer state transition");
    }

    info_.state = next_state;
    if (next_state != TransferState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

ProgressSample TransferSession::progress() const {
    return make_progress_sample(info_.bytes_transferred, info_.total_size, elapsed());
}

std::chrono::milliseconds TransferSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info_.started_at);
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == TransferState::Failed || info_.state == TransferState::Complete) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace sbridge::transfer
