#include "response_decoders.hpp"
#include <cstdio>
#include <initializer_list>
#include <utility>
#include "file_list_parser.hpp"
#include "recdock_protocol.hpp"

namespace recdock::protocol {

namespace {

ProtocolError malformed(const char* what, size_t got, size_t need) {
    char msg[128];
    snprintf(msg, sizeof(msg), "%s: body %zu bytes, need %zu", what, got, need);
    return protocolError(ProtocolError::Kind::MalformedResponse, msg);
}

StatusReply status_of(const Body& body, StatusOutcome zero,
                      std::initializer_list<std::pair<uint8_t, StatusOutcome>> table) {
    StatusReply reply;
    if (body.empty()) return reply;  // Failed, raw = -1
    reply.raw = body[0];
    if (body[0] == 0) {
        reply.outcome = zero;
        return reply;
    }
    for (const auto& entry : table) {
        if (entry.first == body[0]) {
            reply.outcome = entry.second;
            return reply;
        }
    }
    reply.outcome = StatusOutcome::Failed;
    return reply;
}

} // anonymous namespace

std::string from_bcd(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += static_cast<char>('0' + ((data[i] >> 4) & 0x0F));
        out += static_cast<char>('0' + (data[i] & 0x0F));
    }
    return out;
}

std::string format_mac(const uint8_t* mac) {
    char buf[18];
    snprintf(buf, sizeof(buf), "%02X-%02X-%02X-%02X-%02X-%02X",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buf;
}

Result<DeviceInfo, ProtocolError> decode_device_info(const Body& body) {
    if (body.size() < 4) return malformed("device-info", body.size(), 4);

    DeviceInfo info;
    info.version_number = read_be32(body.data());
    char code[16];
    snprintf(code, sizeof(code), "%u.%u.%u",
             unsigned(body[1]), unsigned(body[2]), unsigned(body[3]));
    info.version_code = code;

    for (size_t i = 4; i < 20 && i < body.size(); i++) {
        if (body[i] > 0) info.serial_number += static_cast<char>(body[i]);
    }
    return info;
}

Result<DeviceTime, ProtocolError> decode_device_time(const Body& body) {
    if (body.size() < 7) return malformed("device-time", body.size(), 7);

    std::string digits = from_bcd(body.data(), 7);
    DeviceTime out;
    if (digits == "00000000000000") return out;

    for (char c : digits) {
        if (c < '0' || c > '9') {
            return protocolError(ProtocolError::Kind::MalformedResponse,
                                 "device-time: invalid BCD digit");
        }
    }
    DateTime t;
    t.year = std::stoi(digits.substr(0, 4));
    t.month = std::stoi(digits.substr(4, 2));
    t.day = std::stoi(digits.substr(6, 2));
    t.hour = std::stoi(digits.substr(8, 2));
    t.minute = std::stoi(digits.substr(10, 2));
    t.second = std::stoi(digits.substr(12, 2));
    if (!t.valid()) {
        return protocolError(ProtocolError::Kind::MalformedResponse,
                             "device-time: out of range " + digits);
    }
    out.time = t;
    return out;
}

Result<uint32_t, ProtocolError> decode_file_count(const Body& body) {
    if (body.empty()) return uint32_t(0);
    if (body.size() < 4) return malformed("file-count", body.size(), 4);
    return read_be32(body.data());
}

Result<DeviceSettings, ProtocolError> decode_settings(const Body& body) {
    if (body.size() < 8) return malformed("settings", body.size(), 8);

    DeviceSettings s;
    s.auto_record = body[3] == 1;
    s.auto_play = body[7] == 1;
    s.notification = body.size() >= 12 && body[11] == 1;
    // the prompt-tone slot is inverted: 1 means off
    s.bluetooth_tone = body.size() < 16 || body[15] != 1;
    return s;
}

Result<CardInfo, ProtocolError> decode_card_info(const Body& body) {
    if (body.size() < 12) return malformed("card-info", body.size(), 12);
    CardInfo info;
    info.used = read_be32(body.data());
    info.capacity = read_be32(body.data() + 4);
    info.status = read_be32(body.data() + 8);
    return info;
}

Result<OptionalRecordingFile, ProtocolError> decode_recording_file(const Body& body) {
    if (body.empty()) return OptionalRecordingFile{};

    RecordingFileInfo file;
    file.name.assign(body.begin(), body.end());
    file.created = parse_name_timestamp(file.name, false).time;
    return OptionalRecordingFile{std::move(file)};
}

Result<BluetoothDeviceList, ProtocolError> decode_bluetooth_scan(const Body& body) {
    if (body.size() < 2) return malformed("bluetooth-scan", body.size(), 2);

    uint16_t count = read_be16(body.data());
    BluetoothDeviceList devices;
    size_t pos = 2;
    for (uint16_t i = 0; i < count; i++) {
        if (pos + 2 > body.size()) return malformed("bluetooth-scan entry", body.size(), pos + 2);
        uint16_t name_len = read_be16(body.data() + pos);
        pos += 2;
        if (pos + name_len + 6 > body.size()) {
            return malformed("bluetooth-scan entry", body.size(), pos + name_len + 6);
        }
        BluetoothDevice dev;
        dev.name.assign(body.begin() + pos, body.begin() + pos + name_len);
        pos += name_len;
        dev.mac = format_mac(body.data() + pos);
        pos += 6;
        devices.push_back(std::move(dev));
    }
    return devices;
}

Result<BluetoothStatus, ProtocolError> decode_bluetooth_status(const Body& body) {
    BluetoothStatus status;
    if (body.empty() || body[0] == 1) return status;

    if (body.size() < 3) return malformed("bluetooth-status", body.size(), 3);
    uint16_t name_len = read_be16(body.data() + 1);
    size_t need = 3 + static_cast<size_t>(name_len) + 6 + 4;
    if (body.size() < need) return malformed("bluetooth-status", body.size(), need);

    size_t pos = 3;
    status.connected = true;
    status.name.assign(body.begin() + pos, body.begin() + pos + name_len);
    pos += name_len;
    status.mac = format_mac(body.data() + pos);
    pos += 6;
    status.a2dp = body[pos++] == 1;
    status.hfp = body[pos++] == 1;
    status.avrcp = body[pos++] == 1;
    status.battery = body[pos] * 100 / 255;
    return status;
}

Result<RealtimeData, ProtocolError> decode_realtime_data(const Body& body) {
    if (body.size() < 4) return malformed("realtime-data", body.size(), 4);
    RealtimeData out;
    out.rest = read_be32(body.data());
    out.data.assign(body.begin() + 4, body.end());
    return out;
}

StatusReply decode_generic_status(const Body& body) {
    return status_of(body, StatusOutcome::Success, {});
}

StatusReply decode_delete_status(const Body& body) {
    return status_of(body, StatusOutcome::Success,
                     {{1, StatusOutcome::NotExists}, {2, StatusOutcome::NotExists}});
}

StatusReply decode_firmware_request_status(const Body& body) {
    return status_of(body, StatusOutcome::Accepted,
                     {{1, StatusOutcome::WrongVersion},
                      {2, StatusOutcome::Busy},
                      {3, StatusOutcome::CardFull},
                      {4, StatusOutcome::CardError}});
}

StatusReply decode_update_request_status(const Body& body) {
    return status_of(body, StatusOutcome::Success,
                     {{1, StatusOutcome::LengthMismatch},
                      {2, StatusOutcome::Busy},
                      {3, StatusOutcome::CardFull},
                      {4, StatusOutcome::CardError}});
}

} // namespace recdock::protocol
