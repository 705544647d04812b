// =============================================================================
// recdock - Request Body Builders
// =============================================================================
// Command bodies for the operations that carry arguments. Multi-byte integers
// are big-endian; filenames are sent as raw bytes without a terminator.
// =============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "response_types.hpp"
#include "result.hpp"

namespace recdock::protocol {

using Body = std::vector<uint8_t>;

// Packs a string of decimal digits two per byte ("2024" -> 0x20 0x24).
// An odd-length string is left-padded with '0'.
Body to_bcd(const std::string& digits);

// SetDeviceTime: 7 BCD bytes of YYYYMMDDhhmmss.
Result<Body, ProtocolError> build_set_time(const DateTime& t);

// DeleteFile, TransferFile, TestSnWrite
Body build_filename(const std::string& filename);

// GetFileBlock: length + filename
Body build_file_block(uint32_t length, const std::string& filename);

// ReadFile: offset + length + filename
Body build_read_file(uint32_t offset, uint32_t length, const std::string& filename);

// RequestFirmwareUpgrade: version number + image size
Body build_firmware_request(uint32_t version_number, uint32_t size);

enum class SettingSlot {
    AutoRecord = 0,
    AutoPlay = 1,
    Notification = 2,
    BluetoothPromptTone = 3
};

// SetSettings: 4-byte slots up to and including the addressed one; the
// value byte is 1 for on and 2 for off, inverted for the prompt tone slot.
Body build_set_setting(SettingSlot slot, bool on);

// BluetoothCmd connect: [0x00, mac(6)] from "XX-XX-XX-XX-XX-XX".
Result<Body, ProtocolError> build_bluetooth_connect(const std::string& mac);
Body build_bluetooth_disconnect();

// FormatCard and RestoreFactorySettings confirmation code
Body build_confirm_code();

// BncTest: [1] begin, [0] end
Body build_bnc(bool begin);

enum class RealtimeAction { Start, Pause, Stop };
Body build_realtime_control(RealtimeAction action);

Body build_u32(uint32_t value);

// RequestToneUpdate / RequestUacUpdate: signature hex decoded to bytes + size
Result<Body, ProtocolError> build_update_request(const std::string& signature_hex, uint32_t size);

} // namespace recdock::protocol
