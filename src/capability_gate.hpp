// =============================================================================
// recdock - Capability Gate
// =============================================================================
// Pure (model, firmware version) rules for commands that older firmware or
// other models do not implement. Gated operations are resolved locally with
// ProtocolError::Kind::Unsupported (or an alternate value) without a round trip.
//
// An unknown firmware version never gates: the device is left to answer.
// =============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include "response_types.hpp"

namespace recdock {

enum class Capability {
    FactoryReset,
    RestoreFactorySettings,
    GetSettings,
    SetSettings,              // auto-record, auto-play, notification
    SetBluetoothPromptTone,
    StorageCommands,          // ReadCardInfo, FormatCard, GetRecordingFile
    Bluetooth                 // scan, connect/disconnect, status
};

const char* capability_name(Capability c);

bool is_supported(Capability c, Model model, std::optional<uint32_t> version);

// Older firmware needs the entry count up front to know when the file list ends.
bool needs_file_count_prequery(std::optional<uint32_t> version);

// Returned by get_settings when GetSettings is gated.
inline DeviceSettings gated_settings() { return DeviceSettings{}; }

} // namespace recdock
