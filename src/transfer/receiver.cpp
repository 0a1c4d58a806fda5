#include "sbridge/transfer/receiver.hpp"
#include "sbridge/events/events.hpp"
#include "sbridge/protocol/frame.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>

namespace sbridge::transfer {
namespace fs = std::filesystem;

namespace {

constexpr const char* kFallbackName = "received.bin";

} // namespace

ReceiverEngine::ReceiverEngine(link::Link& link, events::EventBus& bus, TransferOptions options)
    : link_(link)
    , bus_(bus)
    , options_(options) {
}

std::string ReceiverEngine::sanitize_file_name(const std::string& name) {
    std::string candidate = name;
    // Treat both separators as path boundaries regardless of platform
    for (auto& c : candidate) {
        if (c == '\\') {
            c = '/';
        }
    }
    const auto base = fs::path(candidate).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return kFallbackName;
    }
    return base;
}

Result<void> ReceiverEngine::accept_loop(const fs::path& output_dir,
                                         const std::atomic<bool>& stop,
                                         link::LinkTurn* link_turn) {
    bus_.emit(events::ReceiverStartedEvent{link_.describe(), output_dir});

    while (!stop.load()) {
        auto received = receive_next(output_dir, stop, link_turn);
        if (received.is_ok()) {
            continue;
        }

        const auto& error = received.error();
        if (error.code == ErrorCode::Cancelled) {
            break;
        }
        if (error.code == ErrorCode::LinkClosed) {
            bus_.emit(events::ReceiverStoppedEvent{"link lost: " + error.message});
            return Err<void>(error);
        }
        spdlog::warn("[recv] {}; resuming scan", error.describe());
    }

    bus_.emit(events::ReceiverStoppedEvent{"stop requested"});
    return Ok();
}

Result<TransferReport> ReceiverEngine::receive_next(const fs::path& output_dir,
                                                    const std::atomic<bool>& stop,
                                                    link::LinkTurn* link_turn) {
    std::unique_lock<link::LinkTurn> turn;
    if (link_turn != nullptr) {
        turn = std::unique_lock<link::LinkTurn>(*link_turn, std::defer_lock);
    }

    auto header = await_header(stop, turn);
    if (header.is_error()) {
        return Err<TransferReport>(header.error());
    }

    IncomingHeader current = header.value();
    while (true) {
        std::optional<IncomingHeader> superseded_by;
        auto result = receive_body(current, output_dir, stop, superseded_by);
        if (!superseded_by) {
            return result;
        }
        current = *superseded_by;
    }
}

Result<ReceiverEngine::IncomingHeader> ReceiverEngine::await_header(const std::atomic<bool>& stop,
                                                                    std::unique_lock<link::LinkTurn>& turn) {
    std::size_t matched = 0;
    std::size_t discarded = 0;

    while (!stop.load()) {
        if (turn.mutex() != nullptr && !turn.owns_lock()) {
            turn.lock();
        }

        auto read = link_.read_exact(1);
        if (read.is_error()) {
            return Err<IncomingHeader>(read.error());
        }

        if (read.value().empty()) {
            // Idle: give the link back between reads
            discarded += matched;
            matched = 0;
        } else {
            const std::uint8_t byte = read.value().front();
            if (byte == protocol::kHeaderMagic[matched]) {
                if (++matched == protocol::kHeaderMagic.size()) {
                    if (discarded > 0) {
                        spdlog::debug("[recv] discarded {} stray byte(s) before header", discarded);
                    }
                    return read_header_fields();
                }
            } else {
                const bool restarts = byte == protocol::kHeaderMagic[0];
                discarded += matched + (restarts ? 0 : 1);
                matched = restarts ? 1 : 0;
            }
        }

        if (matched == 0 && turn.owns_lock()) {
            turn.unlock();
        }
    }

    return Err<IncomingHeader>(ErrorCode::Cancelled, "stop requested");
}

Result<ReceiverEngine::IncomingHeader> ReceiverEngine::read_header_fields() {
    auto length = link_.read_exact(1);
    if (length.is_error()) {
        return Err<IncomingHeader>(length.error());
    }
    if (length.value().size() != 1) {
        return Err<IncomingHeader>(ErrorCode::ShortRead, "header truncated before name length");
    }

    const std::size_t name_length = length.value().front();
    auto name = link_.read_exact(name_length);
    if (name.is_error()) {
        return Err<IncomingHeader>(name.error());
    }
    if (name.value().size() != name_length) {
        return Err<IncomingHeader>(ErrorCode::ShortRead, "header truncated inside file name");
    }

    auto size = link_.read_exact(protocol::kSizeFieldLength);
    if (size.is_error()) {
        return Err<IncomingHeader>(size.error());
    }
    if (size.value().size() != protocol::kSizeFieldLength) {
        return Err<IncomingHeader>(ErrorCode::ShortRead, "header truncated inside size field");
    }

    IncomingHeader header;
    header.name.assign(name.value().begin(), name.value().end());
    header.size = protocol::read_u64_be(size.value().data());
    return Ok(std::move(header));
}

Result<TransferReport> ReceiverEngine::receive_body(const IncomingHeader& header,
                                                    const fs::path& output_dir,
                                                    const std::atomic<bool>& stop,
                                                    std::optional<IncomingHeader>& superseded_by) {
    const std::string file_name = sanitize_file_name(header.name);
    const fs::path output_path = output_dir / file_name;

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec && !fs::exists(output_dir)) {
        return Err<TransferReport>(ErrorCode::FileError,
                                   "Failed to create directory " + output_dir.string() + ": " + ec.message());
    }

    // Opened before replying so an unwritable destination never yields "OK"
    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<TransferReport>(ErrorCode::FileError, "Failed to open " + output_path.string());
    }

    TransferSession session(Direction::Receive, file_name, header.size);
    if (auto begun = session.begin_handshake(); begun.is_error()) {
        return Err<TransferReport>(begun.error());
    }
    if (auto ok = link_.write(protocol::encode_handshake_reply()); ok.is_error()) {
        return fail(session, ok.error());
    }
    if (auto started = session.start_transfer(); started.is_error()) {
        return fail(session, started.error());
    }
    bus_.emit(events::TransferStartedEvent{Direction::Receive, file_name, header.size, output_path, 1});

    TransferReport report;
    report.direction = Direction::Receive;
    report.file_name = file_name;
    report.path = output_path;
    report.total_size = header.size;

    std::optional<std::uint32_t> last_written;
    auto last_activity = std::chrono::steady_clock::now();

    while (true) {
        if (stop.load()) {
            return fail(session, Error{ErrorCode::Cancelled, "stopped mid-transfer; partial file left at " +
                                                             output_path.string()});
        }

        auto window = link_.read_exact(protocol::kMarkerWindow);
        if (window.is_error()) {
            return fail(session, window.error());
        }
        if (window.value().empty()) {
            if (std::chrono::steady_clock::now() - last_activity > options_.stall_timeout) {
                return fail(session, Error{ErrorCode::TransferStalled,
                                           "no data for " + std::to_string(options_.stall_timeout.count()) + "ms"});
            }
            continue;
        }
        last_activity = std::chrono::steady_clock::now();

        if (window.value().size() < protocol::kMarkerWindow) {
            spdlog::debug("[recv] {}: dropped {} byte(s) of a truncated frame", file_name, window.value().size());
            continue;
        }
        if (protocol::is_done(window.value())) {
            break;
        }
        if (protocol::is_header_magic(window.value())) {
            // The sender gave up on this file and announced a new one
            auto next = read_header_fields();
            if (next.is_error()) {
                return fail(session, next.error());
            }
            superseded_by = next.value();
            return fail(session, Error{ErrorCode::Cancelled, "superseded by new header for " + next.value().name});
        }

        auto rest = link_.read_exact(protocol::kChunkPrefixLength - protocol::kMarkerWindow);
        if (rest.is_error()) {
            return fail(session, rest.error());
        }
        protocol::Bytes prefix_bytes = window.value();
        prefix_bytes.insert(prefix_bytes.end(), rest.value().begin(), rest.value().end());
        const auto prefix = protocol::parse_chunk_prefix(prefix_bytes);
        if (!prefix) {
            spdlog::debug("[recv] {}: short chunk header ({} bytes)", file_name, prefix_bytes.size());
            continue;
        }

        auto payload = link_.read_exact(prefix->length);
        if (payload.is_error()) {
            return fail(session, payload.error());
        }
        auto checksum = link_.read_exact(protocol::kChecksumLength);
        if (checksum.is_error()) {
            return fail(session, checksum.error());
        }

        if (payload.value().size() != prefix->length || checksum.value().size() != protocol::kChecksumLength) {
            auto nak = reply_nak(session, prefix->seq, ErrorCode::ShortRead,
                                 "got " + std::to_string(payload.value().size()) + "/" +
                                 std::to_string(prefix->length) + " payload bytes");
            if (nak.is_error()) {
                return fail(session, nak.error());
            }
            continue;
        }

        if (!protocol::verify_checksum(payload.value(), checksum.value())) {
            auto nak = reply_nak(session, prefix->seq, ErrorCode::ChecksumMismatch, "crc mismatch");
            if (nak.is_error()) {
                return fail(session, nak.error());
            }
            continue;
        }

        if (prefix->seq != session.next_seq()) {
            if (last_written && prefix->seq == *last_written) {
                // Our ACK was lost and the sender repeated the chunk
                if (auto ack = link_.write(protocol::encode_ack(prefix->seq)); ack.is_error()) {
                    return fail(session, ack.error());
                }
                bus_.emit(events::DuplicateChunkEvent{file_name, prefix->seq});
                continue;
            }
            auto nak = reply_nak(session, prefix->seq, ErrorCode::OutOfSequence,
                                 "expected seq=" + std::to_string(session.next_seq()));
            if (nak.is_error()) {
                return fail(session, nak.error());
            }
            continue;
        }

        output.write(reinterpret_cast<const char*>(payload.value().data()),
                     static_cast<std::streamsize>(payload.value().size()));
        if (!output) {
            return fail(session, Error{ErrorCode::FileError, "Failed to write " + output_path.string()});
        }

        const std::uint32_t seq = prefix->seq;
        if (auto recorded = session.record_chunk(payload.value().size()); recorded.is_error()) {
            return fail(session, recorded.error());
        }
        last_written = seq;
        ++report.chunks;

        if (auto ack = link_.write(protocol::encode_ack(seq)); ack.is_error()) {
            return fail(session, ack.error());
        }
        bus_.emit(events::ChunkAcknowledgedEvent{Direction::Receive, file_name, seq, payload.value().size(), 1});
        bus_.emit(events::TransferProgressEvent{Direction::Receive, file_name,
                                                session.bytes_transferred(), header.size, session.progress()});
    }

    output.close();
    if (!output) {
        return fail(session, Error{ErrorCode::FileError, "Failed to close " + output_path.string()});
    }
    if (auto completed = session.complete(); completed.is_error()) {
        return fail(session, completed.error());
    }

    if (session.bytes_transferred() != header.size) {
        spdlog::warn("[recv] {}: announced {} bytes but received {}",
                     file_name, header.size, session.bytes_transferred());
    }

    report.bytes_transferred = session.bytes_transferred();
    report.duration = session.elapsed();
    bus_.emit(events::TransferProgressEvent{Direction::Receive, file_name, report.bytes_transferred,
                                            header.size, session.progress()});
    bus_.emit(events::TransferCompletedEvent{report});
    return Ok(std::move(report));
}

Result<void> ReceiverEngine::reply_nak(TransferSession& session, std::uint32_t seq,
                                       ErrorCode reason, std::string detail) {
    bus_.emit(events::ChunkRejectedEvent{Direction::Receive, session.file_name(), seq, reason, std::move(detail)});
    return link_.write(protocol::encode_nak(seq));
}

Result<TransferReport> ReceiverEngine::fail(TransferSession& session, Error error) {
    if (auto marked = session.mark_failed(error.message); marked.is_error()) {
        spdlog::warn("[recv] {}: {}", session.file_name(), marked.error().describe());
    }
    bus_.emit(events::TransferFailedEvent{Direction::Receive, session.file_name(), error,
                                          session.bytes_transferred()});
    return Err<TransferReport>(std::move(error));
}

} // namespace sbridge::transfer
