#pragma once
// =============================================================================
// recdock Config Loader
// =============================================================================
// Loads recdock.json with nlohmann/json. Every key is optional; a missing
// file, a parse error or a value of the wrong type keeps the default.
//
//   {
//     "usb":      { "product_id": 45069, "read_chunk_size": 51200 },
//     "session":  { "quiet_interval_ms": 10 },
//     "timeouts": { "file_list": 20 },
//     "log":      { "log_path": "recdock.log", "level": "debug" }
//   }
// =============================================================================

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "device_session.hpp"

namespace recdock {
namespace config {

struct UsbConfig {
    int vendor_id = 0x10D6;
    int product_id = 0;  // 0 = any known model
    int endpoint_out = 0x01;
    int endpoint_in = 0x82;
    int interface_number = 0;
    int configuration = 1;
    int read_chunk_size = 51200;
    int read_timeout_ms = 200;
    int write_timeout_ms = 5000;
};

struct SessionConfig {
    int quiet_interval_ms = 10;
    int transfer_quiet_interval_ms = 1000;
    int flush_threshold_bytes = 524288;
    int health_poll_interval_ms = 100;
    int max_buffer_bytes = 16777216;
};

// Seconds.
struct TimeoutConfig {
    int device_info = 5;
    int file_count = 5;
    int file_list = 20;
    int command = 5;
    int delete_file = 10;
    int format_card = 60;
    int bluetooth_scan = 20;
    int firmware = 30;
};

struct LogConfig {
    std::string log_path;  // empty = stderr only
    std::string level = "info";
};

struct AppConfig {
    UsbConfig usb;
    SessionConfig session;
    TimeoutConfig timeouts;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j.at(section).contains(key)) {
            return j.at(section).at(key).get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        // wrong type: keep the default
    }
    return def;
}

// Parses an in-memory document; errors leave `config` at its defaults.
bool parseConfig(const std::string& text, AppConfig& config);

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
AppConfig loadConfig(const std::string& configPath = "recdock.json", bool strict = false);

// RECDOCK_LOG_LEVEL, RECDOCK_LOG_PATH, RECDOCK_PRODUCT_ID (hex or decimal)
void applyEnvironmentOverrides(AppConfig& config);

// Applies the log section: level filter and optional log file.
void applyLogConfig(const LogConfig& log);

SessionOptions toSessionOptions(const AppConfig& config);

} // namespace config
} // namespace recdock
