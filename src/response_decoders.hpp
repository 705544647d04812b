// =============================================================================
// recdock - Response Decoders
// =============================================================================
// Fixed-layout reply bodies to structured values. All decoders bound-check
// against the body size and report short bodies as MalformedResponse.
// Status bytes outside a family's table decode to StatusOutcome::Failed.
// =============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "response_types.hpp"
#include "result.hpp"

namespace recdock::protocol {

using Body = std::vector<uint8_t>;

Result<DeviceInfo, ProtocolError> decode_device_info(const Body& body);
Result<DeviceTime, ProtocolError> decode_device_time(const Body& body);
Result<uint32_t, ProtocolError> decode_file_count(const Body& body);
Result<DeviceSettings, ProtocolError> decode_settings(const Body& body);
Result<CardInfo, ProtocolError> decode_card_info(const Body& body);
Result<OptionalRecordingFile, ProtocolError> decode_recording_file(const Body& body);
Result<BluetoothDeviceList, ProtocolError> decode_bluetooth_scan(const Body& body);
Result<BluetoothStatus, ProtocolError> decode_bluetooth_status(const Body& body);
Result<RealtimeData, ProtocolError> decode_realtime_data(const Body& body);

// Acknowledgement families
StatusReply decode_generic_status(const Body& body);
StatusReply decode_delete_status(const Body& body);
StatusReply decode_firmware_request_status(const Body& body);
StatusReply decode_update_request_status(const Body& body);  // tone / UAC

// Packed BCD helpers: each byte holds two decimal digits.
std::string from_bcd(const uint8_t* data, size_t len);

// "AA-BB-CC-DD-EE-FF" from 6 raw bytes (uppercase)
std::string format_mac(const uint8_t* mac);

} // namespace recdock::protocol
