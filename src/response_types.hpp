// =============================================================================
// recdock - Structured Response Types
// =============================================================================
// Values produced by the response decoders and delivered to callers.
// =============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace recdock {

enum class Model { Unknown, H1, H1E, P1 };

inline const char* model_name(Model m) {
    switch (m) {
        case Model::H1:  return "hidock-h1";
        case Model::H1E: return "hidock-h1e";
        case Model::P1:  return "hidock-p1";
        case Model::Unknown: break;
    }
    return "unknown";
}

struct DateTime {
    int year = 0;
    int month = 0;   // 1-12
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const DateTime& o) const {
        return year == o.year && month == o.month && day == o.day &&
               hour == o.hour && minute == o.minute && second == o.second;
    }
    bool operator!=(const DateTime& o) const { return !(*this == o); }

    // "YYYY-MM-DD hh:mm:ss"
    std::string to_string() const;

    // Calendar and clock range check (leap years included).
    bool valid() const;
};

struct DeviceInfo {
    uint32_t version_number = 0;
    std::string version_code;   // "b1.b2.b3"
    std::string serial_number;
};

struct DeviceTime {
    std::optional<DateTime> time;  // nullopt when the device clock is unset

    std::string to_string() const { return time ? time->to_string() : "unknown"; }
};

struct RecordingEntry {
    std::string name;
    std::optional<DateTime> created;
    double duration_ms = 0.0;
    uint32_t length = 0;
    uint8_t version = 0;       // codec/version tag
    std::string signature;     // 16 bytes as 32 lowercase hex digits
};

struct DeviceSettings {
    bool auto_record = false;
    bool auto_play = false;
    bool bluetooth_tone = false;
    bool notification = false;

    bool operator==(const DeviceSettings& o) const {
        return auto_record == o.auto_record && auto_play == o.auto_play &&
               bluetooth_tone == o.bluetooth_tone && notification == o.notification;
    }
};

struct CardInfo {
    uint32_t used = 0;
    uint32_t capacity = 0;
    uint32_t status = 0;

    std::string status_hex() const;
};

// Closed set of acknowledgement outcomes across all status-reply families.
enum class StatusOutcome {
    Success,
    Failed,
    NotExists,
    Accepted,
    WrongVersion,
    Busy,
    CardFull,
    CardError,
    LengthMismatch
};

inline const char* outcome_name(StatusOutcome o) {
    switch (o) {
        case StatusOutcome::Success:        return "success";
        case StatusOutcome::Failed:         return "failed";
        case StatusOutcome::NotExists:      return "not-exists";
        case StatusOutcome::Accepted:       return "accepted";
        case StatusOutcome::WrongVersion:   return "wrong-version";
        case StatusOutcome::Busy:           return "busy";
        case StatusOutcome::CardFull:       return "card-full";
        case StatusOutcome::CardError:      return "card-error";
        case StatusOutcome::LengthMismatch: return "length-mismatch";
    }
    return "failed";
}

struct StatusReply {
    StatusOutcome outcome = StatusOutcome::Failed;
    int raw = -1;  // status byte, -1 for an empty body

    bool ok() const {
        return outcome == StatusOutcome::Success || outcome == StatusOutcome::Accepted;
    }
};

struct BluetoothDevice {
    std::string name;
    std::string mac;  // "XX-XX-XX-XX-XX-XX"
};

struct BluetoothStatus {
    bool connected = false;
    std::string name;
    std::string mac;
    bool a2dp = false;
    bool hfp = false;
    bool avrcp = false;
    int battery = 0;  // percent
};

struct RecordingFileInfo {
    std::string name;
    std::optional<DateTime> created;
};

struct TransferSummary {
    std::string filename;
    uint32_t expected = 0;
    uint64_t received = 0;
    uint64_t elapsed_ms = 0;
    std::vector<uint8_t> data;  // empty when a chunk sink consumed the stream
};

struct RealtimeData {
    uint32_t rest = 0;
    std::vector<uint8_t> data;
};

using RawBody = std::vector<uint8_t>;
using RecordingList = std::vector<RecordingEntry>;
using BluetoothDeviceList = std::vector<BluetoothDevice>;
using OptionalRecordingFile = std::optional<RecordingFileInfo>;

// Every decoded reply is one of these. std::monostate is used for
// operations resolved without a body of interest.
using ResponseValue = std::variant<
    std::monostate,
    DeviceInfo,
    DeviceTime,
    uint32_t,
    RecordingList,
    DeviceSettings,
    CardInfo,
    StatusReply,
    BluetoothDeviceList,
    BluetoothStatus,
    OptionalRecordingFile,
    TransferSummary,
    RealtimeData,
    RawBody>;

} // namespace recdock
