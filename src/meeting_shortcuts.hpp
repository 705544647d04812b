// =============================================================================
// recdock - Meeting Shortcut Injection (SendScheduleInfo)
// =============================================================================
// The device can replay keyboard shortcuts into a meeting app during a
// scheduled window. Each schedule is 52 bytes:
//
//   start:    8 bytes  [YY YY MM DD hh mm ss 0] as decimal values (zeros if unset)
//   end:      8 bytes  same layout
//   reserved: 2 bytes
//   shortcut: 34 bytes [0, mode flags] + 4 HID reports of 8 bytes
//
// HID report: [report type, modifiers, key1, key2, 0, 0, 0, 0]
// Modifier bits: ctrl 1, shift 2, alt 4, gui 8.
// =============================================================================
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "response_types.hpp"

namespace recdock::protocol {

static constexpr size_t SCHEDULE_ENTRY_SIZE = 52;
static constexpr size_t SHORTCUT_BLOCK_SIZE = 34;

// HID usage ids
namespace hid {
static constexpr uint8_t KEY_CUSTOM_1 = 1;
static constexpr uint8_t KEY_A = 4;
static constexpr uint8_t KEY_ENTER = 40;
static constexpr uint8_t KEY_ESCAPE = 41;
static constexpr uint8_t KEY_SPACE = 44;

static constexpr uint8_t MOD_CTRL = 1;
static constexpr uint8_t MOD_SHIFT = 2;
static constexpr uint8_t MOD_ALT = 4;
static constexpr uint8_t MOD_GUI = 8;

static constexpr uint8_t REPORT_KEYBOARD = 3;

// 'A'..'Z' -> 4..29
inline uint8_t letter(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    if (c < 'A' || c > 'Z') return 0;
    return static_cast<uint8_t>(KEY_A + (c - 'A'));
}
} // namespace hid

enum class MeetingPlatform {
    Zoom, Teams, GoogleMeeting, Webex, Feishu, Lark, WeChat, Line, WhatsApp, Slack, Discord
};

enum class HostOs { Windows, Mac, Linux };

// "zoom", "teams", "google-meeting", ... Returns false for unknown names.
bool platform_from_name(const std::string& name, MeetingPlatform& out);
bool os_from_name(const std::string& name, HostOs& out);

using ShortcutBlock = std::array<uint8_t, SHORTCUT_BLOCK_SIZE>;

// Linux and unknown combinations yield an all-zero block.
ShortcutBlock shortcut_block(MeetingPlatform platform, HostOs os);

struct ScheduleInfo {
    std::optional<DateTime> start;
    std::optional<DateTime> end;
    std::optional<MeetingPlatform> platform;
    HostOs os = HostOs::Windows;
};

// Concatenated 52-byte entries; an empty list encodes as 52 zero bytes.
std::vector<uint8_t> build_schedule_info(const std::vector<ScheduleInfo>& schedules);

} // namespace recdock::protocol
