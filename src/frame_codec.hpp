// =============================================================================
// recdock - Frame Codec
// =============================================================================
// Serializes command frames and extracts complete frames from a byte stream.
// See recdock_protocol.hpp for the wire layout.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include "recdock_protocol.hpp"
#include "result.hpp"

namespace recdock::protocol {

// One decoded frame. `id` is kept as the raw wire value so that frames with
// ids outside the command table can still be logged and discarded.
struct Message {
    uint16_t id = 0;
    uint32_t sequence = 0;
    std::vector<uint8_t> body;

    bool operator==(const Message& other) const {
        return id == other.id && sequence == other.sequence && body == other.body;
    }
};

enum class DecodeStatus {
    Ok,            // message + consumed are valid
    NeedMoreData,  // header or declared body/checksum not fully buffered yet
    InvalidFrame   // sync marker mismatch; stream must be resynchronized
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::NeedMoreData;
    Message message;
    size_t consumed = 0;     // header + body + checksum bytes
    uint8_t checksum_len = 0;
};

// Builds a frame with a zero flag byte. Fails with InvalidArgument when the
// body does not fit the 24-bit length field.
Result<std::vector<uint8_t>, ProtocolError> encode_frame(
    uint16_t command, uint32_t sequence, const uint8_t* body, size_t body_len);

inline Result<std::vector<uint8_t>, ProtocolError> encode_frame(
    Command command, uint32_t sequence, const std::vector<uint8_t>& body) {
    return encode_frame(to_wire(command), sequence, body.data(), body.size());
}

// Attempts to decode one frame starting at `offset` in `buf[0..len)`.
// Never reads outside the buffer; all lengths are treated as untrusted.
DecodeResult try_decode(const uint8_t* buf, size_t len, size_t offset = 0);

} // namespace recdock::protocol
