#include "sbridge/transfer/sender.hpp"
#include "sbridge/events/events.hpp"
#include "sbridge/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <thread>
#include <vector>

namespace sbridge::transfer {
namespace fs = std::filesystem;

namespace {

std::string hex_preview(const protocol::Bytes& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

} // namespace

SenderEngine::SenderEngine(link::Link& link, events::EventBus& bus, TransferOptions options)
    : link_(link)
    , bus_(bus)
    , options_(options) {
}

Result<TransferReport> SenderEngine::send_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<TransferReport>(ErrorCode::FileError, "File not found: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<TransferReport>(ErrorCode::FileError, "Cannot stat " + path.string() + ": " + ec.message());
    }
    if (options_.chunk_size == 0 || options_.chunk_size > protocol::kMaxChunkPayload) {
        return Err<TransferReport>(ErrorCode::InvalidArgument,
                                   "chunk_size must be within 1..65535");
    }

    const std::string file_name = path.filename().string();
    auto header = protocol::encode_header(file_name, size);
    if (header.is_error()) {
        return Err<TransferReport>(header.error());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<TransferReport>(ErrorCode::FileError, "Failed to open source file: " + path.string());
    }

    TransferSession session(Direction::Send, file_name, size);
    if (auto begun = session.begin_handshake(); begun.is_error()) {
        return Err<TransferReport>(begun.error());
    }

    auto handshake = perform_handshake(header.value(), file_name);
    if (handshake.is_error()) {
        return fail(session, handshake.error());
    }

    if (auto started = session.start_transfer(); started.is_error()) {
        return fail(session, started.error());
    }
    bus_.emit(events::TransferStartedEvent{Direction::Send, file_name, size, path, handshake.value()});

    TransferReport report;
    report.direction = Direction::Send;
    report.file_name = file_name;
    report.path = path;
    report.total_size = size;
    report.retries = handshake.value() - 1;

    std::vector<std::uint8_t> buffer(options_.chunk_size);
    while (true) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(options_.chunk_size));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }
        buffer.resize(bytes_read);

        const std::uint32_t seq = session.next_seq();
        auto attempts = send_chunk(seq, buffer, file_name);
        if (attempts.is_error()) {
            return fail(session, attempts.error());
        }

        if (auto recorded = session.record_chunk(bytes_read); recorded.is_error()) {
            return fail(session, recorded.error());
        }
        report.retries += attempts.value() - 1;
        ++report.chunks;

        bus_.emit(events::ChunkAcknowledgedEvent{Direction::Send, file_name, seq, bytes_read, attempts.value()});
        bus_.emit(events::TransferProgressEvent{Direction::Send, file_name,
                                                session.bytes_transferred(), size, session.progress()});

        buffer.resize(options_.chunk_size);
    }

    if (input.bad()) {
        return fail(session, Error{ErrorCode::FileError, "Read error on " + path.string()});
    }

    if (auto done = link_.write(protocol::encode_done()); done.is_error()) {
        return fail(session, done.error());
    }
    if (auto flushed = link_.flush(); flushed.is_error()) {
        return fail(session, flushed.error());
    }

    if (auto completed = session.complete(); completed.is_error()) {
        return fail(session, completed.error());
    }

    report.bytes_transferred = session.bytes_transferred();
    report.duration = session.elapsed();

    bus_.emit(events::TransferProgressEvent{Direction::Send, file_name, report.bytes_transferred, size,
                                            make_progress_sample(size, size, session.elapsed())});
    bus_.emit(events::TransferCompletedEvent{report});
    return Ok(std::move(report));
}

Result<unsigned int> SenderEngine::perform_handshake(const protocol::Bytes& header,
                                                     const std::string& file_name) {
    for (unsigned int attempt = 1; attempt <= options_.handshake_retries; ++attempt) {
        if (auto written = link_.write(header); written.is_error()) {
            return Err<unsigned int>(written.error());
        }

        auto reply = link_.read_exact(protocol::kHandshakeReply.size());
        if (reply.is_error()) {
            return Err<unsigned int>(reply.error());
        }
        if (protocol::is_handshake_reply(reply.value())) {
            return Ok(attempt);
        }

        spdlog::debug("[send] {} handshake attempt {}/{}: reply '{}'",
                      file_name, attempt, options_.handshake_retries, hex_preview(reply.value()));
        if (!reply.value().empty()) {
            link_.discard_input();
        }
        if (attempt < options_.handshake_retries) {
            std::this_thread::sleep_for(options_.handshake_backoff);
        }
    }

    return Err<unsigned int>(ErrorCode::HandshakeTimeout,
                             "No OK from receiver after " + std::to_string(options_.handshake_retries) +
                             " attempts. Ensure the receiver is active.");
}

Result<unsigned int> SenderEngine::send_chunk(std::uint32_t seq, const protocol::Bytes& payload,
                                              const std::string& file_name) {
    auto frame = protocol::encode_chunk(seq, payload);
    if (frame.is_error()) {
        return Err<unsigned int>(frame.error());
    }

    for (unsigned int attempt = 1; attempt <= options_.chunk_retries; ++attempt) {
        if (auto written = link_.write(frame.value()); written.is_error()) {
            return Err<unsigned int>(written.error());
        }

        auto raw = link_.read_exact(protocol::kReplyLength);
        if (raw.is_error()) {
            return Err<unsigned int>(raw.error());
        }

        const auto reply = protocol::parse_reply(raw.value());
        if (reply && reply->kind == protocol::ReplyKind::Ack && reply->seq == seq) {
            return Ok(attempt);
        }

        events::ChunkRejectedEvent rejected{Direction::Send, file_name, seq, ErrorCode::ShortRead, {}};
        if (!reply) {
            if (raw.value().size() == protocol::kReplyLength) {
                rejected.reason = ErrorCode::UnexpectedReply;
                rejected.detail = "unrecognised reply " + hex_preview(raw.value());
            } else {
                rejected.detail = "got " + std::to_string(raw.value().size()) + " of 7 reply bytes";
            }
            // A partial or garbled reply leaves the stream misaligned
            if (!raw.value().empty()) {
                link_.discard_input();
            }
        } else if (reply->kind == protocol::ReplyKind::Nak) {
            rejected.reason = ErrorCode::ChecksumMismatch;
            rejected.detail = "NAK seq=" + std::to_string(reply->seq);
        } else {
            rejected.reason = ErrorCode::UnexpectedReply;
            rejected.detail = "ACK for seq=" + std::to_string(reply->seq);
        }
        bus_.emit(rejected);

        if (attempt < options_.chunk_retries) {
            std::this_thread::sleep_for(options_.chunk_backoff);
        }
    }

    return Err<unsigned int>(ErrorCode::ChunkTransferFailure,
                             "Chunk seq " + std::to_string(seq) + " failed after " +
                             std::to_string(options_.chunk_retries) + " attempts");
}

Result<TransferReport> SenderEngine::fail(TransferSession& session, Error error) {
    if (auto marked = session.mark_failed(error.message); marked.is_error()) {
        spdlog::warn("[send] {}: {}", session.file_name(), marked.error().describe());
    }
    bus_.emit(events::TransferFailedEvent{Direction::Send, session.file_name(), error,
                                          session.bytes_transferred()});
    return Err<TransferReport>(std::move(error));
}

} // namespace sbridge::transfer
