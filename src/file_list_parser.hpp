// =============================================================================
// recdock - File List Parser
// =============================================================================
// Decodes the GetFileList stream into RecordingEntry values.
//
// Stream layout (optionally prefixed by FF FF + u32 BE total entry count):
//   tag:       1 byte   codec/version
//   name_len:  3 bytes  BE
//   name:      name_len bytes (zero bytes are dropped)
//   length:    4 bytes  BE payload length
//   reserved:  6 bytes
//   signature: 16 bytes
// A trailing partial entry is left unparsed.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "response_types.hpp"

namespace recdock::protocol {

enum class NameForm {
    None,       // no recognizable timestamp
    Digits,     // 20240115093000REC001.wav
    MonthName   // 2024Jan15-093000-Rec01.hda
};

struct NameTimestamp {
    NameForm form = NameForm::None;
    std::optional<DateTime> time;  // nullopt when the form matched but the date is invalid
};

// `month_form_wav` also accepts .wav for the month-name form; the
// recording-file reply only carries .hda names in that form.
NameTimestamp parse_name_timestamp(const std::string& name, bool month_form_wav = true);

// Tag-selected duration in milliseconds. Unrecognized tags yield 0.
double recording_duration_ms(uint8_t tag, uint32_t length, NameForm form);

struct FileListParse {
    std::vector<RecordingEntry> entries;   // every complete entry, timed or not
    std::optional<uint32_t> header_total;  // from the FF FF prefix
};

FileListParse parse_file_list(const uint8_t* data, size_t len);

// Keeps only entries whose timestamp resolved.
RecordingList timed_entries(std::vector<RecordingEntry> entries);

/**
 * Multi-frame accumulation for one GetFileList request.
 * Finishes when the parsed entry count (before filtering) reaches the known
 * count or the header total, or when an empty body arrives.
 */
class FileListAccumulator {
public:
    void begin(std::optional<uint32_t> known_count);
    void reset();
    bool active() const { return active_; }
    size_t buffered() const { return bytes_.size(); }

    // Returns the filtered list once complete, nullopt while more is expected.
    std::optional<RecordingList> feed(const std::vector<uint8_t>& body);

private:
    std::vector<uint8_t> bytes_;
    std::optional<uint32_t> known_count_;
    bool active_ = false;
};

} // namespace recdock::protocol
