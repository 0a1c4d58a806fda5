#pragma once

#include "sbridge/core/result.hpp"
#include "sbridge/events/event_bus.hpp"
#include "sbridge/link/link.hpp"
#include "sbridge/link/link_turn.hpp"
#include "sbridge/transfer/session.hpp"
#include "sbridge/transfer/types.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace sbridge::transfer {

/**
 * @brief Accepts files announced by a remote SenderEngine
 *
 * Every read is bounded by the link read timeout and the stop flag is
 * checked between reads, so a stop request is honoured within one timeout.
 * A file interrupted by stop, stall or link loss stays on disk as written so
 * far.
 *
 * Link turn-taking: when a LinkTurn is supplied, it is held for each scan
 * read, kept while a partial "FILE" magic is matched, and kept for the whole
 * body once a header was accepted. A local sender holding the same turn
 * therefore never reads bytes meant for this engine, and vice versa.
 *
 * Chunk acceptance:
 * - the expected sequence with a valid CRC is written, then ACKed
 * - a repeat of the last written sequence is ACKed again without writing
 * - anything else is NAKed and nothing is written
 */
class ReceiverEngine {
public:
    ReceiverEngine(link::Link& link, events::EventBus& bus, TransferOptions options = {});

    /**
     * @brief Receive files until stop is set or the link is lost
     *
     * Per-file failures are logged and scanning resumes.
     *
     * @return Ok on stop, LinkClosed when the link went away
     */
    Result<void> accept_loop(const std::filesystem::path& output_dir,
                             const std::atomic<bool>& stop,
                             link::LinkTurn* link_turn = nullptr);

    /**
     * @brief Scan for the next header and receive that one file
     *
     * @return Cancelled when stop was observed, ShortRead for a truncated
     *         header, or the failure that ended the file
     */
    Result<TransferReport> receive_next(const std::filesystem::path& output_dir,
                                        const std::atomic<bool>& stop,
                                        link::LinkTurn* link_turn = nullptr);

    /// Reduce a received name to a safe base name inside the output directory
    static std::string sanitize_file_name(const std::string& name);

private:
    struct IncomingHeader {
        std::string name;
        std::uint64_t size = 0;
    };

    Result<IncomingHeader> await_header(const std::atomic<bool>& stop,
                                        std::unique_lock<link::LinkTurn>& turn);
    Result<IncomingHeader> read_header_fields();

    Result<TransferReport> receive_body(const IncomingHeader& header,
                                        const std::filesystem::path& output_dir,
                                        const std::atomic<bool>& stop,
                                        std::optional<IncomingHeader>& superseded_by);

    Result<void> reply_nak(TransferSession& session, std::uint32_t seq,
                           ErrorCode reason, std::string detail);

    Result<TransferReport> fail(TransferSession& session, Error error);

    link::Link& link_;
    events::EventBus& bus_;
    TransferOptions options_;
};

} // namespace sbridge::transfer
