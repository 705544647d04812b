#include "meeting_shortcuts.hpp"
#include <initializer_list>
#include "recdock_log.hpp"

namespace recdock::protocol {

namespace {

using Report = std::array<uint8_t, 8>;

const Report NONE = {0, 0, 0, 0, 0, 0, 0, 0};

Report keys(uint8_t modifiers, uint8_t key1, uint8_t key2 = 0,
            uint8_t type = hid::REPORT_KEYBOARD) {
    return Report{type, modifiers, key1, key2, 0, 0, 0, 0};
}

// Report with a non-keyboard type and no keys (zoom's leave sequence).
Report raw(uint8_t type, uint8_t modifiers) {
    return Report{type, modifiers, 0, 0, 0, 0, 0, 0};
}

// Mode header; each flag enables a device-side behaviour for the slot.
std::array<uint8_t, 2> mode(bool a = false, bool b = false, bool c = false, bool d = false) {
    uint8_t flags = 0;
    if (a) flags |= 1;
    if (b) flags |= 2;
    if (c) flags |= 4;
    if (d) flags |= 8;
    return {0, flags};
}

ShortcutBlock block(std::array<uint8_t, 2> header, const Report& r1, const Report& r2,
                    const Report& r3, const Report& r4) {
    ShortcutBlock out{};
    size_t pos = 0;
    out[pos++] = header[0];
    out[pos++] = header[1];
    for (const Report* r : {&r1, &r2, &r3, &r4}) {
        for (uint8_t b : *r) out[pos++] = b;
    }
    return out;
}

constexpr uint8_t CTRL = hid::MOD_CTRL;
constexpr uint8_t SHIFT = hid::MOD_SHIFT;
constexpr uint8_t ALT = hid::MOD_ALT;
constexpr uint8_t GUI = hid::MOD_GUI;

uint8_t K(char c) { return hid::letter(c); }

ShortcutBlock windows_block(MeetingPlatform p) {
    switch (p) {
        case MeetingPlatform::Zoom:
            return block(mode(false, true), raw(4, 1), keys(ALT, K('Q')), raw(4, 16), NONE);
        case MeetingPlatform::Teams:
            return block(mode(), keys(CTRL | SHIFT, K('A')), keys(CTRL | SHIFT, K('H')),
                         keys(CTRL | SHIFT, K('D')), keys(CTRL | SHIFT, K('M')));
        case MeetingPlatform::GoogleMeeting:
            return block(mode(), NONE, NONE, NONE, keys(CTRL, K('D')));
        case MeetingPlatform::Webex:
            return block(mode(), keys(CTRL | SHIFT, K('C')), keys(CTRL, K('L')),
                         keys(CTRL, K('D')), keys(CTRL, K('M')));
        case MeetingPlatform::Feishu:
        case MeetingPlatform::Lark:
            return block(mode(), NONE, NONE, NONE, keys(CTRL | SHIFT, K('D')));
        case MeetingPlatform::WeChat:
        case MeetingPlatform::WhatsApp:
            return block(mode(), NONE, NONE, NONE, NONE);
        case MeetingPlatform::Line:
            return block(mode(false, true, true), NONE, keys(0, hid::KEY_ESCAPE),
                         keys(0, hid::KEY_ESCAPE), keys(CTRL | SHIFT, K('A')));
        case MeetingPlatform::Slack:
            return block(mode(), NONE, NONE, NONE, keys(CTRL | SHIFT, hid::KEY_SPACE));
        case MeetingPlatform::Discord:
            return block(mode(), keys(CTRL, hid::KEY_ENTER), NONE,
                         keys(0, hid::KEY_ESCAPE), keys(CTRL | SHIFT, K('M')));
    }
    return ShortcutBlock{};
}

ShortcutBlock mac_block(MeetingPlatform p) {
    switch (p) {
        case MeetingPlatform::Zoom:
            return block(mode(false, true), raw(4, 1), keys(GUI, K('W')), raw(4, 16), NONE);
        case MeetingPlatform::Teams:
            return block(mode(), keys(GUI | SHIFT, K('A')), keys(GUI | SHIFT, K('H')),
                         keys(GUI | SHIFT, K('D')), keys(GUI | SHIFT, K('M')));
        case MeetingPlatform::GoogleMeeting:
            return block(mode(), NONE, NONE, NONE, keys(GUI, K('D')));
        case MeetingPlatform::Webex:
            return block(mode(), keys(CTRL | SHIFT, K('C')), keys(GUI, K('L')),
                         keys(GUI | SHIFT, K('D')), keys(GUI | SHIFT, K('M')));
        case MeetingPlatform::Feishu:
        case MeetingPlatform::Lark:
            return block(mode(), NONE, NONE, NONE, keys(GUI | SHIFT, K('D')));
        case MeetingPlatform::WeChat:
            return block(mode(), NONE, NONE, NONE, NONE);
        case MeetingPlatform::Line:
            return block(mode(false, true, true), NONE, keys(0, hid::KEY_ESCAPE),
                         keys(0, hid::KEY_ESCAPE), keys(GUI | SHIFT, K('A')));
        case MeetingPlatform::WhatsApp:
            return block(mode(), NONE, keys(GUI, K('W')), keys(GUI, K('W')),
                         keys(GUI | SHIFT, K('M')));
        case MeetingPlatform::Slack:
            return block(mode(), NONE, NONE, NONE, keys(GUI | SHIFT, hid::KEY_SPACE));
        case MeetingPlatform::Discord:
            return block(mode(), keys(GUI, hid::KEY_ENTER), NONE,
                         keys(GUI, hid::KEY_ESCAPE), keys(GUI | SHIFT, K('M')));
    }
    return ShortcutBlock{};
}

// [YY, YY, MM, DD, hh, mm, ss, 0]
void append_date(std::vector<uint8_t>& out, const DateTime& t) {
    out.push_back(static_cast<uint8_t>(t.year / 100));
    out.push_back(static_cast<uint8_t>(t.year % 100));
    out.push_back(static_cast<uint8_t>(t.month));
    out.push_back(static_cast<uint8_t>(t.day));
    out.push_back(static_cast<uint8_t>(t.hour));
    out.push_back(static_cast<uint8_t>(t.minute));
    out.push_back(static_cast<uint8_t>(t.second));
    out.push_back(0);
}

} // anonymous namespace

bool platform_from_name(const std::string& name, MeetingPlatform& out) {
    static const struct { const char* name; MeetingPlatform platform; } table[] = {
        {"zoom", MeetingPlatform::Zoom},
        {"teams", MeetingPlatform::Teams},
        {"google-meeting", MeetingPlatform::GoogleMeeting},
        {"webex", MeetingPlatform::Webex},
        {"feishu", MeetingPlatform::Feishu},
        {"lark", MeetingPlatform::Lark},
        {"wechat", MeetingPlatform::WeChat},
        {"line", MeetingPlatform::Line},
        {"whats-app", MeetingPlatform::WhatsApp},
        {"slack", MeetingPlatform::Slack},
        {"discord", MeetingPlatform::Discord},
    };
    for (const auto& e : table) {
        if (name == e.name) {
            out = e.platform;
            return true;
        }
    }
    return false;
}

bool os_from_name(const std::string& name, HostOs& out) {
    if (name == "Windows") { out = HostOs::Windows; return true; }
    if (name == "Mac")     { out = HostOs::Mac;     return true; }
    if (name == "Linux")   { out = HostOs::Linux;   return true; }
    return false;
}

ShortcutBlock shortcut_block(MeetingPlatform platform, HostOs os) {
    switch (os) {
        case HostOs::Windows: return windows_block(platform);
        case HostOs::Mac:     return mac_block(platform);
        case HostOs::Linux:   break;
    }
    return ShortcutBlock{};
}

std::vector<uint8_t> build_schedule_info(const std::vector<ScheduleInfo>& schedules) {
    if (schedules.empty()) {
        return std::vector<uint8_t>(SCHEDULE_ENTRY_SIZE, 0);
    }

    std::vector<uint8_t> out;
    out.reserve(schedules.size() * SCHEDULE_ENTRY_SIZE);
    for (const auto& s : schedules) {
        // dates are sent only as a pair
        if (s.start && s.end) {
            append_date(out, *s.start);
            append_date(out, *s.end);
        } else {
            out.insert(out.end(), 16, 0);
        }
        out.push_back(0);
        out.push_back(0);

        ShortcutBlock shortcut{};
        if (s.platform) shortcut = shortcut_block(*s.platform, s.os);
        out.insert(out.end(), shortcut.begin(), shortcut.end());
    }
    RLOG_DEBUG("handler", "Schedule info: %zu entries, %zu bytes", schedules.size(), out.size());
    return out;
}

} // namespace recdock::protocol
