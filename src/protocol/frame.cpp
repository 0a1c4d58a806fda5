#include "sbridge/protocol/frame.hpp"

#include <boost/crc.hpp>

#include <algorithm>

namespace sbridge::protocol {
namespace {

template<std::size_t N>
bool equals(const Bytes& bytes, const std::array<std::uint8_t, N>& expected) {
    return bytes.size() == N && std::equal(expected.begin(), expected.end(), bytes.begin());
}

Bytes encode_reply(const std::array<std::uint8_t, 3>& tag, std::uint32_t seq) {
    Bytes out(tag.begin(), tag.end());
    append_u32_be(out, seq);
    return out;
}

} // namespace

std::uint32_t crc32(const std::uint8_t* data, std::size_t size) {
    boost::crc_32_type crc;
    crc.process_bytes(data, size);
    return crc.checksum();
}

std::uint32_t crc32(const Bytes& data) {
    return crc32(data.data(), data.size());
}

Result<Bytes> encode_header(const std::string& name, std::uint64_t size) {
    if (name.empty()) {
        return Err<Bytes>(ErrorCode::InvalidArgument, "file name is empty");
    }
    if (name.size() > kMaxNameLength) {
        return Err<Bytes>(ErrorCode::InvalidArgument,
                          "file name exceeds 255 bytes: " + std::to_string(name.size()));
    }

    Bytes out(kHeaderMagic.begin(), kHeaderMagic.end());
    out.reserve(kHeaderMagic.size() + 1 + name.size() + kSizeFieldLength);
    out.push_back(static_cast<std::uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
    append_u64_be(out, size);
    return Ok(std::move(out));
}

Result<Bytes> encode_chunk(std::uint32_t seq, const Bytes& payload) {
    if (payload.size() > kMaxChunkPayload) {
        return Err<Bytes>(ErrorCode::InvalidArgument,
                          "chunk payload exceeds 65535 bytes: " + std::to_string(payload.size()));
    }

    Bytes out;
    out.reserve(kChunkPrefixLength + payload.size() + kChecksumLength);
    append_u32_be(out, seq);
    append_u16_be(out, static_cast<std::uint16_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    append_u32_be(out, crc32(payload));
    return Ok(std::move(out));
}

Bytes encode_ack(std::uint32_t seq) {
    return encode_reply(kAckTag, seq);
}

Bytes encode_nak(std::uint32_t seq) {
    return encode_reply(kNakTag, seq);
}

Bytes encode_done() {
    return Bytes(kDoneMarker.begin(), kDoneMarker.end());
}

Bytes encode_handshake_reply() {
    return Bytes(kHandshakeReply.begin(), kHandshakeReply.end());
}

Result<Bytes> encode(const Frame& frame) {
    struct Visitor {
        Result<Bytes> operator()(const HeaderFrame& f) const { return encode_header(f.name, f.size); }
        Result<Bytes> operator()(const ChunkFrame& f) const { return encode_chunk(f.seq, f.payload); }
        Result<Bytes> operator()(const AckFrame& f) const { return Ok(encode_ack(f.seq)); }
        Result<Bytes> operator()(const NakFrame& f) const { return Ok(encode_nak(f.seq)); }
        Result<Bytes> operator()(const DoneFrame&) const { return Ok(encode_done()); }
    };
    return std::visit(Visitor{}, frame);
}

void append_u16_be(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

void append_u32_be(Bytes& out, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void append_u64_be(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

std::uint16_t read_u16_be(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[0]) << 8) | data[1]);
}

std::uint32_t read_u32_be(const std::uint8_t* data) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

std::uint64_t read_u64_be(const std::uint8_t* data) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

bool is_handshake_reply(const Bytes& bytes) {
    return equals(bytes, kHandshakeReply);
}

bool is_done(const Bytes& window) {
    return equals(window, kDoneMarker);
}

bool is_header_magic(const Bytes& window) {
    return equals(window, kHeaderMagic);
}

std::optional<Reply> parse_reply(const Bytes& bytes) {
    if (bytes.size() != kReplyLength) {
        return std::nullopt;
    }

    Reply reply;
    if (std::equal(kAckTag.begin(), kAckTag.end(), bytes.begin())) {
        reply.kind = ReplyKind::Ack;
    } else if (std::equal(kNakTag.begin(), kNakTag.end(), bytes.begin())) {
        reply.kind = ReplyKind::Nak;
    } else {
        return std::nullopt;
    }
    reply.seq = read_u32_be(bytes.data() + kAckTag.size());
    return reply;
}

std::optional<ChunkPrefix> parse_chunk_prefix(const Bytes& bytes) {
    if (bytes.size() != kChunkPrefixLength) {
        return std::nullopt;
    }
    return ChunkPrefix{read_u32_be(bytes.data()), read_u16_be(bytes.data() + 4)};
}

bool verify_checksum(const Bytes& payload, const Bytes& checksum_bytes) {
    if (checksum_bytes.size() != kChecksumLength) {
        return false;
    }
    return read_u32_be(checksum_bytes.data()) == crc32(payload);
}

} // namespace sbridge::protocol
