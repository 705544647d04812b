#include "request_builders.hpp"
#include <cstdio>
#include "recdock_protocol.hpp"

namespace recdock::protocol {

namespace {

void append_be32(Body& out, uint32_t v) {
    uint8_t b[4];
    write_be32(b, v);
    out.insert(out.end(), b, b + 4);
}

void append_string(Body& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

ProtocolError invalid(const std::string& msg) {
    return protocolError(ProtocolError::Kind::InvalidArgument, msg);
}

} // anonymous namespace

Body to_bcd(const std::string& digits) {
    std::string d = digits.size() % 2 ? "0" + digits : digits;
    Body out;
    out.reserve(d.size() / 2);
    for (size_t i = 0; i + 1 < d.size(); i += 2) {
        uint8_t hi = static_cast<uint8_t>(d[i] - '0') & 0x0F;
        uint8_t lo = static_cast<uint8_t>(d[i + 1] - '0') & 0x0F;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Result<Body, ProtocolError> build_set_time(const DateTime& t) {
    if (!t.valid() || t.year > 9999) {
        return invalid("set-device-time: invalid date " + t.to_string());
    }
    char digits[16];
    snprintf(digits, sizeof(digits), "%04d%02d%02d%02d%02d%02d",
             t.year, t.month, t.day, t.hour, t.minute, t.second);
    return to_bcd(digits);
}

Body build_filename(const std::string& filename) {
    return Body(filename.begin(), filename.end());
}

Body build_file_block(uint32_t length, const std::string& filename) {
    Body out;
    out.reserve(4 + filename.size());
    append_be32(out, length);
    append_string(out, filename);
    return out;
}

Body build_read_file(uint32_t offset, uint32_t length, const std::string& filename) {
    Body out;
    out.reserve(8 + filename.size());
    append_be32(out, offset);
    append_be32(out, length);
    append_string(out, filename);
    return out;
}

Body build_firmware_request(uint32_t version_number, uint32_t size) {
    Body out;
    append_be32(out, version_number);
    append_be32(out, size);
    return out;
}

Body build_set_setting(SettingSlot slot, bool on) {
    size_t index = static_cast<size_t>(slot);
    Body out((index + 1) * 4, 0);
    uint8_t value = on ? 1 : 2;
    if (slot == SettingSlot::BluetoothPromptTone) value = on ? 2 : 1;
    out[index * 4 + 3] = value;
    return out;
}

Result<Body, ProtocolError> build_bluetooth_connect(const std::string& mac) {
    // XX-XX-XX-XX-XX-XX
    if (mac.size() != 17) return invalid("bluetooth-connect: malformed MAC '" + mac + "'");

    Body out;
    out.push_back(0x00);
    for (size_t i = 0; i < 6; i++) {
        size_t p = i * 3;
        if (i > 0 && mac[p - 1] != '-') {
            return invalid("bluetooth-connect: malformed MAC '" + mac + "'");
        }
        int hi = hex_value(mac[p]);
        int lo = hex_value(mac[p + 1]);
        if (hi < 0 || lo < 0) return invalid("bluetooth-connect: malformed MAC '" + mac + "'");
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Body build_bluetooth_disconnect() {
    return Body{0x01};
}

Body build_confirm_code() {
    return Body{1, 2, 3, 4};
}

Body build_bnc(bool begin) {
    return Body{static_cast<uint8_t>(begin ? 1 : 0)};
}

Body build_realtime_control(RealtimeAction action) {
    uint8_t code = 0;
    switch (action) {
        case RealtimeAction::Start: code = 0; break;
        case RealtimeAction::Pause: code = 1; break;
        case RealtimeAction::Stop:  code = 2; break;
    }
    return Body{0, 0, 0, code, 0, 0, 0, 1};
}

Body build_u32(uint32_t value) {
    Body out;
    append_be32(out, value);
    return out;
}

Result<Body, ProtocolError> build_update_request(const std::string& signature_hex, uint32_t size) {
    if (signature_hex.size() % 2 != 0) {
        return invalid("update-request: odd-length signature");
    }
    Body out;
    out.reserve(signature_hex.size() / 2 + 4);
    for (size_t i = 0; i < signature_hex.size(); i += 2) {
        int hi = hex_value(signature_hex[i]);
        int lo = hex_value(signature_hex[i + 1]);
        if (hi < 0 || lo < 0) return invalid("update-request: non-hex signature");
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    append_be32(out, size);
    return out;
}

} // namespace recdock::protocol
