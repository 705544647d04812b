#include "file_list_parser.hpp"
#include <cctype>
#include <regex>
#include "recdock_log.hpp"
#include "recdock_protocol.hpp"

namespace recdock::protocol {

namespace {

const std::regex& digits_form() {
    static const std::regex re(R"(^\d{14}REC\d+\.wav$)", std::regex::icase);
    return re;
}

const std::regex& month_form(bool with_wav) {
    static const std::regex hda_wav(
        R"(^(\d{2})?(\d{2})(\w{3})(\d{2})-(\d{2})(\d{2})(\d{2})-.*\.(hda|wav)$)",
        std::regex::icase);
    static const std::regex hda_only(
        R"(^(\d{2})?(\d{2})(\w{3})(\d{2})-(\d{2})(\d{2})(\d{2})-.*\.hda$)",
        std::regex::icase);
    return with_wav ? hda_wav : hda_only;
}

int month_from_name(const std::string& name) {
    static const char* names[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                  "jul", "aug", "sep", "oct", "nov", "dec"};
    if (name.size() != 3) return 0;
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (int i = 0; i < 12; i++) {
        if (lower == names[i]) return i + 1;
    }
    return 0;
}

int to_int(const std::string& s, size_t pos, size_t n) {
    int v = 0;
    for (size_t i = pos; i < pos + n && i < s.size(); i++) {
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

} // anonymous namespace

NameTimestamp parse_name_timestamp(const std::string& name, bool month_form_wav) {
    NameTimestamp out;
    std::smatch m;

    if (std::regex_match(name, digits_form())) {
        out.form = NameForm::Digits;
        DateTime t;
        t.year = to_int(name, 0, 4);
        t.month = to_int(name, 4, 2);
        t.day = to_int(name, 6, 2);
        t.hour = to_int(name, 8, 2);
        t.minute = to_int(name, 10, 2);
        t.second = to_int(name, 12, 2);
        if (t.valid()) out.time = t;
        return out;
    }

    if (std::regex_match(name, m, month_form(month_form_wav))) {
        out.form = NameForm::MonthName;
        DateTime t;
        t.year = 2000 + std::stoi(m[2].str());
        t.month = month_from_name(m[3].str());
        t.day = std::stoi(m[4].str());
        t.hour = std::stoi(m[5].str());
        t.minute = std::stoi(m[6].str());
        t.second = std::stoi(m[7].str());
        if (t.valid()) out.time = t;
        return out;
    }

    return out;
}

double recording_duration_ms(uint8_t tag, uint32_t length, NameForm form) {
    double len = static_cast<double>(length);
    double base = 0.0;
    if (form == NameForm::Digits) base = len / 32.0;
    else if (form == NameForm::MonthName) base = (len / 32.0) * 4.0;

    double pcm = length > 44 ? len - 44.0 : 0.0;
    switch (tag) {
        case 0: return base;
        case 1: return base * 2.0;
        case 2: return pcm / 48.0 / 2.0;
        case 3: return pcm / 48.0 / 2.0 / 2.0;
        case 5: return len / 12.0;
        default: return 0.0;
    }
}

FileListParse parse_file_list(const uint8_t* data, size_t len) {
    FileListParse out;
    size_t y = 0;

    if (len >= 6 && data[0] == 0xFF && data[1] == 0xFF) {
        out.header_total = read_be32(data + 2);
        y = 6;
    }

    static const char* hex = "0123456789abcdef";
    while (y < len) {
        if (y + 4 >= len) break;
        uint8_t tag = data[y];
        uint32_t name_len = read_be24(data + y + 1);
        y += 4;

        std::string name;
        for (uint32_t n = 0; n < name_len && y < len; n++, y++) {
            if (data[y] > 0) name += static_cast<char>(data[y]);
        }

        if (y + 4 + 6 + 16 > len) break;
        uint32_t length = read_be32(data + y);
        y += 4 + 6;

        std::string signature;
        signature.reserve(32);
        for (int n = 0; n < 16; n++, y++) {
            signature += hex[(data[y] >> 4) & 0x0F];
            signature += hex[data[y] & 0x0F];
        }

        NameTimestamp ts = parse_name_timestamp(name);

        RecordingEntry entry;
        entry.name = std::move(name);
        entry.created = ts.time;
        entry.duration_ms = recording_duration_ms(tag, length, ts.form);
        entry.length = length;
        entry.version = tag;
        entry.signature = std::move(signature);
        out.entries.push_back(std::move(entry));
    }
    return out;
}

RecordingList timed_entries(std::vector<RecordingEntry> entries) {
    RecordingList out;
    out.reserve(entries.size());
    for (auto& e : entries) {
        if (e.created) out.push_back(std::move(e));
    }
    return out;
}

// =============================================================================
// FileListAccumulator
// =============================================================================

void FileListAccumulator::begin(std::optional<uint32_t> known_count) {
    bytes_.clear();
    known_count_ = known_count;
    active_ = true;
}

void FileListAccumulator::reset() {
    bytes_.clear();
    known_count_.reset();
    active_ = false;
}

std::optional<RecordingList> FileListAccumulator::feed(const std::vector<uint8_t>& body) {
    active_ = true;
    if (body.empty()) {
        // end-of-list marker: whatever has accumulated is the whole list
        auto parsed = parse_file_list(bytes_.data(), bytes_.size());
        RLOG_DEBUG("handler", "File list closed by empty frame: %zu entries",
                   parsed.entries.size());
        reset();
        return timed_entries(std::move(parsed.entries));
    }

    bytes_.insert(bytes_.end(), body.begin(), body.end());
    auto parsed = parse_file_list(bytes_.data(), bytes_.size());
    size_t n = parsed.entries.size();

    bool done = (known_count_ && n >= *known_count_) ||
                (parsed.header_total && n >= *parsed.header_total);
    if (!done) {
        RLOG_TRACE("handler", "File list: %zu entries so far (%zu bytes)", n, bytes_.size());
        return std::nullopt;
    }

    RLOG_DEBUG("handler", "File list complete: %zu entries", n);
    reset();
    return timed_entries(std::move(parsed.entries));
}

} // namespace recdock::protocol
