/**
 * @file frame.hpp
 * @brief Wire frames exchanged over the serial link
 *
 * All integers are big-endian. Frames are self-delimiting through fixed-width
 * fields only, there is no length prefix or escaping:
 *
 *   Header   "FILE" | name_len (1) | name | size (8)
 *   Reply    "OK"
 *   Chunk    seq (4) | length (2) | payload | crc32 (4)
 *   Ack/Nak  "ACK" | seq (4)   or   "NAK" | seq (4)
 *   Done     "DONE"
 *
 * Frame type is implied by protocol position, so decoding is a set of
 * fixed-width parse helpers that the engines apply to bytes they have read.
 */

#pragma once

#include "sbridge/core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sbridge::protocol {

using Bytes = std::vector<std::uint8_t>;

constexpr std::array<std::uint8_t, 4> kHeaderMagic{'F', 'I', 'L', 'E'};
constexpr std::array<std::uint8_t, 4> kDoneMarker{'D', 'O', 'N', 'E'};
constexpr std::array<std::uint8_t, 2> kHandshakeReply{'O', 'K'};
constexpr std::array<std::uint8_t, 3> kAckTag{'A', 'C', 'K'};
constexpr std::array<std::uint8_t, 3> kNakTag{'N', 'A', 'K'};

constexpr std::size_t kMaxNameLength = 255;
constexpr std::size_t kMaxChunkPayload = 0xFFFF;
constexpr std::size_t kSizeFieldLength = 8;
constexpr std::size_t kChunkPrefixLength = 6;   ///< seq (4) + length (2)
constexpr std::size_t kChecksumLength = 4;
constexpr std::size_t kReplyLength = 7;         ///< tag (3) + seq (4)
constexpr std::size_t kMarkerWindow = 4;        ///< window compared with "DONE"

struct HeaderFrame {
    std::string name;
    std::uint64_t size = 0;
};

struct ChunkFrame {
    std::uint32_t seq = 0;
    Bytes payload;
};

struct AckFrame {
    std::uint32_t seq = 0;
};

struct NakFrame {
    std::uint32_t seq = 0;
};

struct DoneFrame {};

using Frame = std::variant<HeaderFrame, ChunkFrame, AckFrame, NakFrame, DoneFrame>;

enum class ReplyKind {
    Ack,
    Nak
};

struct Reply {
    ReplyKind kind = ReplyKind::Nak;
    std::uint32_t seq = 0;
};

struct ChunkPrefix {
    std::uint32_t seq = 0;
    std::uint16_t length = 0;
};

/// CRC-32 (IEEE 802.3 polynomial, same as zlib) over the given bytes
std::uint32_t crc32(const std::uint8_t* data, std::size_t size);
std::uint32_t crc32(const Bytes& data);

// Encoding

Result<Bytes> encode_header(const std::string& name, std::uint64_t size);
Result<Bytes> encode_chunk(std::uint32_t seq, const Bytes& payload);
Bytes encode_ack(std::uint32_t seq);
Bytes encode_nak(std::uint32_t seq);
Bytes encode_done();
Bytes encode_handshake_reply();

/**
 * @brief Encode any frame
 *
 * Fails only for frames that cannot be represented on the wire: a header
 * name outside 1..255 bytes or a chunk payload above 65535 bytes.
 */
Result<Bytes> encode(const Frame& frame);

// Fixed-width decoding

void append_u16_be(Bytes& out, std::uint16_t value);
void append_u32_be(Bytes& out, std::uint32_t value);
void append_u64_be(Bytes& out, std::uint64_t value);

std::uint16_t read_u16_be(const std::uint8_t* data);
std::uint32_t read_u32_be(const std::uint8_t* data);
std::uint64_t read_u64_be(const std::uint8_t* data);

/// True when the bytes are exactly "OK"
bool is_handshake_reply(const Bytes& bytes);

/// True when the 4-byte window is the "DONE" sentinel
bool is_done(const Bytes& window);

/// True when the 4-byte window is the "FILE" magic
bool is_header_magic(const Bytes& window);

/// Parse a 7-byte chunk reply; nullopt for short input or an unknown tag
std::optional<Reply> parse_reply(const Bytes& bytes);

/// Parse the 6-byte seq/length prefix of a chunk frame
std::optional<ChunkPrefix> parse_chunk_prefix(const Bytes& bytes);

/// True when the checksum bytes match crc32(payload)
bool verify_checksum(const Bytes& payload, const Bytes& checksum_bytes);

} // namespace sbridge::protocol
