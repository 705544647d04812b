// =============================================================================
// recdock - Protocol Constants & Utilities
// =============================================================================
// Command identifiers, frame layout and USB identifiers for the recorder
// command protocol.
//
// Frame (12-byte header, all fields big-endian):
//   sync:   2 bytes (0x12 0x34)
//   cmd:    2 bytes
//   seq:    4 bytes
//   flags:  1 byte  (trailing checksum length)
//   len:    3 bytes (body length)
//   body:   len bytes
//   checksum: flags bytes (0 or 2 in practice)
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>

namespace recdock::protocol {

static constexpr uint8_t SYNC_0 = 0x12;
static constexpr uint8_t SYNC_1 = 0x34;
static constexpr size_t HEADER_SIZE = 12;
static constexpr uint32_t MAX_BODY_LEN = 0x00FFFFFF;

// Command identifiers. The numeric values are fixed by device firmware.
enum class Command : uint16_t {
    Invalid                = 0,
    GetDeviceInfo          = 1,
    GetDeviceTime          = 2,
    SetDeviceTime          = 3,
    GetFileList            = 4,
    TransferFile           = 5,
    GetFileCount           = 6,
    DeleteFile             = 7,
    RequestFirmwareUpgrade = 8,
    FirmwareUpload         = 9,
    BncTest                = 10,
    GetSettings            = 11,
    SetSettings            = 12,
    GetFileBlock           = 13,
    ReadCardInfo           = 16,
    FormatCard             = 17,
    GetRecordingFile       = 18,
    RestoreFactorySettings = 19,
    SendScheduleInfo       = 20,
    ReadFile               = 21,
    RequestToneUpdate      = 22,
    UpdateTone             = 23,
    RequestUacUpdate       = 24,
    UpdateUac              = 25,
    GetRealtimeSettings    = 32,
    ControlRealtime        = 33,
    GetRealtimeData        = 34,
    BluetoothScan          = 4097,
    BluetoothCmd           = 4098,
    BluetoothStatus        = 4099,
    TestSnWrite            = 61447,
    RecordTestStart        = 61448,
    RecordTestEnd          = 61449,
    FactoryReset           = 61451,
};

inline uint16_t to_wire(Command cmd) { return static_cast<uint16_t>(cmd); }

// Maps a wire id back onto the closed command set. Returns false for ids the
// protocol does not define.
inline bool command_from_wire(uint16_t id, Command& out) {
    switch (static_cast<Command>(id)) {
        case Command::Invalid:
        case Command::GetDeviceInfo:
        case Command::GetDeviceTime:
        case Command::SetDeviceTime:
        case Command::GetFileList:
        case Command::TransferFile:
        case Command::GetFileCount:
        case Command::DeleteFile:
        case Command::RequestFirmwareUpgrade:
        case Command::FirmwareUpload:
        case Command::BncTest:
        case Command::GetSettings:
        case Command::SetSettings:
        case Command::GetFileBlock:
        case Command::ReadCardInfo:
        case Command::FormatCard:
        case Command::GetRecordingFile:
        case Command::RestoreFactorySettings:
        case Command::SendScheduleInfo:
        case Command::ReadFile:
        case Command::RequestToneUpdate:
        case Command::UpdateTone:
        case Command::RequestUacUpdate:
        case Command::UpdateUac:
        case Command::GetRealtimeSettings:
        case Command::ControlRealtime:
        case Command::GetRealtimeData:
        case Command::BluetoothScan:
        case Command::BluetoothCmd:
        case Command::BluetoothStatus:
        case Command::TestSnWrite:
        case Command::RecordTestStart:
        case Command::RecordTestEnd:
        case Command::FactoryReset:
            out = static_cast<Command>(id);
            return true;
    }
    return false;
}

// Streaming commands deliver many frames per request.
inline bool is_streaming(Command cmd) {
    return cmd == Command::TransferFile || cmd == Command::GetFileBlock ||
           cmd == Command::ReadFile;
}

// =============================================================================
// USB identification
// =============================================================================
static constexpr uint16_t VENDOR_ID = 0x10D6;
static constexpr uint16_t PID_H1  = 0xB00C;  // 45068
static constexpr uint16_t PID_H1E = 0xB00D;  // 45069
static constexpr uint16_t PID_P1  = 0xB00E;  // 45070

static constexpr uint8_t EP_OUT = 0x01;
static constexpr uint8_t EP_IN  = 0x82;
static constexpr int USB_CONFIGURATION = 1;
static constexpr int USB_INTERFACE = 0;
static constexpr int USB_ALT_SETTING = 0;

// =============================================================================
// Command name for logging
// =============================================================================
inline const char* cmd_name(Command cmd) {
    switch (cmd) {
        case Command::Invalid:                return "invalid-0";
        case Command::GetDeviceInfo:          return "get-device-info";
        case Command::GetDeviceTime:          return "get-device-time";
        case Command::SetDeviceTime:          return "set-device-time";
        case Command::GetFileList:            return "get-file-list";
        case Command::TransferFile:           return "transfer-file";
        case Command::GetFileCount:           return "get-file-count";
        case Command::DeleteFile:             return "delete-file";
        case Command::RequestFirmwareUpgrade: return "request-firmware-upgrade";
        case Command::FirmwareUpload:         return "firmware-upload";
        case Command::BncTest:                return "bnc-test";
        case Command::GetSettings:            return "get-settings";
        case Command::SetSettings:            return "set-settings";
        case Command::GetFileBlock:           return "get-file-block";
        case Command::ReadCardInfo:           return "read-card-info";
        case Command::FormatCard:             return "format-card";
        case Command::GetRecordingFile:       return "get-recording-file";
        case Command::RestoreFactorySettings: return "restore-factory-settings";
        case Command::SendScheduleInfo:       return "send-schedule-info";
        case Command::ReadFile:               return "read-file";
        case Command::RequestToneUpdate:      return "request-tone-update";
        case Command::UpdateTone:             return "update-tone";
        case Command::RequestUacUpdate:       return "request-uac-update";
        case Command::UpdateUac:              return "update-uac";
        case Command::GetRealtimeSettings:    return "get-realtime-settings";
        case Command::ControlRealtime:        return "control-realtime";
        case Command::GetRealtimeData:        return "get-realtime-data";
        case Command::BluetoothScan:          return "bluetooth-scan";
        case Command::BluetoothCmd:           return "bluetooth-cmd";
        case Command::BluetoothStatus:        return "bluetooth-status";
        case Command::TestSnWrite:            return "test-sn-write";
        case Command::RecordTestStart:        return "record-test-start";
        case Command::RecordTestEnd:          return "record-test-end";
        case Command::FactoryReset:           return "factory-reset";
    }
    return "unknown";
}

// =============================================================================
// Big-endian field helpers
// =============================================================================
inline uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

inline uint32_t read_be24(const uint8_t* p) {
    return (uint32_t(p[0]) << 16) | (uint32_t(p[1]) << 8) | uint32_t(p[2]);
}

inline uint32_t read_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline void write_be16(uint8_t* p, uint16_t v) {
    p[0] = (v >> 8) & 0xFF;
    p[1] = v & 0xFF;
}

inline void write_be32(uint8_t* p, uint32_t v) {
    p[0] = (v >> 24) & 0xFF;
    p[1] = (v >> 16) & 0xFF;
    p[2] = (v >> 8) & 0xFF;
    p[3] = v & 0xFF;
}

} // namespace recdock::protocol
