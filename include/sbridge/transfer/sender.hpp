#pragma once

#include "sbridge/core/result.hpp"
#include "sbridge/events/event_bus.hpp"
#include "sbridge/link/link.hpp"
#include "sbridge/protocol/frame.hpp"
#include "sbridge/transfer/session.hpp"
#include "sbridge/transfer/types.hpp"

#include <filesystem>
#include <string>

namespace sbridge::transfer {

/**
 * @brief Stop-and-wait transmitter for one file at a time
 *
 * Runs on the caller's thread and blocks on link I/O. The caller must hold
 * the link for the whole call; replies are read straight off the link.
 */
class SenderEngine {
public:
    SenderEngine(link::Link& link, events::EventBus& bus, TransferOptions options = {});

    /**
     * @brief Handshake, stream every chunk, then send "DONE"
     *
     * @return HandshakeTimeout, ChunkTransferFailure, FileError, LinkClosed
     *         or InvalidArgument (name too long) on failure
     */
    Result<TransferReport> send_file(const std::filesystem::path& path);

private:
    /// Returns the number of attempts the handshake took
    Result<unsigned int> perform_handshake(const protocol::Bytes& header, const std::string& file_name);

    /// Returns the number of transmissions the chunk took
    Result<unsigned int> send_chunk(std::uint32_t seq, const protocol::Bytes& payload,
                                    const std::string& file_name);

    Result<TransferReport> fail(TransferSession& session, Error error);

    link::Link& link_;
    events::EventBus& bus_;
    TransferOptions options_;
};

} // namespace sbridge::transfer
