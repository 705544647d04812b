#include "frame_codec.hpp"
#include <cstring>
#include "recdock_log.hpp"

namespace recdock::protocol {

Result<std::vector<uint8_t>, ProtocolError> encode_frame(
    uint16_t command, uint32_t sequence, const uint8_t* body, size_t body_len) {
    if (body_len > MAX_BODY_LEN) {
        RLOG_ERROR("codec", "Body too large: %zu bytes (max %u)", body_len, MAX_BODY_LEN);
        return protocolError(ProtocolError::Kind::InvalidArgument, "frame body exceeds 24-bit length");
    }

    std::vector<uint8_t> frame(HEADER_SIZE + body_len);
    frame[0] = SYNC_0;
    frame[1] = SYNC_1;
    write_be16(frame.data() + 2, command);
    write_be32(frame.data() + 4, sequence);
    // flags byte stays 0: outgoing frames carry no checksum
    write_be32(frame.data() + 8, static_cast<uint32_t>(body_len));

    if (body && body_len > 0) {
        memcpy(frame.data() + HEADER_SIZE, body, body_len);
    }
    return frame;
}

DecodeResult try_decode(const uint8_t* buf, size_t len, size_t offset) {
    DecodeResult result;
    if (offset > len || len - offset < HEADER_SIZE) {
        result.status = DecodeStatus::NeedMoreData;
        return result;
    }

    const uint8_t* p = buf + offset;
    size_t available = len - offset;

    if (p[0] != SYNC_0 || p[1] != SYNC_1) {
        result.status = DecodeStatus::InvalidFrame;
        return result;
    }

    uint16_t id = read_be16(p + 2);
    uint32_t seq = read_be32(p + 4);
    uint32_t len_word = read_be32(p + 8);
    uint8_t checksum_len = static_cast<uint8_t>((len_word >> 24) & 0xFF);
    uint32_t body_len = len_word & MAX_BODY_LEN;

    size_t total = HEADER_SIZE + static_cast<size_t>(body_len) + checksum_len;
    if (available < total) {
        result.status = DecodeStatus::NeedMoreData;
        return result;
    }

    result.status = DecodeStatus::Ok;
    result.message.id = id;
    result.message.sequence = seq;
    result.message.body.assign(p + HEADER_SIZE, p + HEADER_SIZE + body_len);
    result.consumed = total;
    result.checksum_len = checksum_len;
    return result;
}

} // namespace recdock::protocol
