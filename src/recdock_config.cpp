#include "recdock_config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "recdock_log.hpp"

namespace recdock {
namespace config {

namespace {

template<typename T>
void readInto(const nlohmann::json& j, const char* section, const char* key, T& field) {
    field = jsonGet<T>(j, section, key, field);
}

// Accepts "0xB00D", "45069"; returns false on anything else.
bool parseUnsigned(const std::string& text, unsigned long& out) {
    try {
        size_t used = 0;
        unsigned long v = std::stoul(text, &used, 0);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::chrono::milliseconds seconds(int s) {
    return std::chrono::milliseconds(static_cast<int64_t>(s) * 1000);
}

} // anonymous namespace

bool parseConfig(const std::string& text, AppConfig& config) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        RLOG_ERROR("config", "JSON parse error: %s", e.what());
        return false;
    }
    if (!j.is_object()) {
        RLOG_ERROR("config", "Top-level JSON value is not an object");
        return false;
    }

    readInto(j, "usb", "vendor_id", config.usb.vendor_id);
    readInto(j, "usb", "product_id", config.usb.product_id);
    readInto(j, "usb", "endpoint_out", config.usb.endpoint_out);
    readInto(j, "usb", "endpoint_in", config.usb.endpoint_in);
    readInto(j, "usb", "interface_number", config.usb.interface_number);
    readInto(j, "usb", "configuration", config.usb.configuration);
    readInto(j, "usb", "read_chunk_size", config.usb.read_chunk_size);
    readInto(j, "usb", "read_timeout_ms", config.usb.read_timeout_ms);
    readInto(j, "usb", "write_timeout_ms", config.usb.write_timeout_ms);

    readInto(j, "session", "quiet_interval_ms", config.session.quiet_interval_ms);
    readInto(j, "session", "transfer_quiet_interval_ms", config.session.transfer_quiet_interval_ms);
    readInto(j, "session", "flush_threshold_bytes", config.session.flush_threshold_bytes);
    readInto(j, "session", "health_poll_interval_ms", config.session.health_poll_interval_ms);
    readInto(j, "session", "max_buffer_bytes", config.session.max_buffer_bytes);

    readInto(j, "timeouts", "device_info", config.timeouts.device_info);
    readInto(j, "timeouts", "file_count", config.timeouts.file_count);
    readInto(j, "timeouts", "file_list", config.timeouts.file_list);
    readInto(j, "timeouts", "command", config.timeouts.command);
    readInto(j, "timeouts", "delete_file", config.timeouts.delete_file);
    readInto(j, "timeouts", "format_card", config.timeouts.format_card);
    readInto(j, "timeouts", "bluetooth_scan", config.timeouts.bluetooth_scan);
    readInto(j, "timeouts", "firmware", config.timeouts.firmware);

    readInto(j, "log", "log_path", config.log.log_path);
    readInto(j, "log", "level", config.log.level);
    return true;
}

AppConfig loadConfig(const std::string& configPath, bool strict) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("./recdock.json");
    }
    if (!file.is_open()) {
        RLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    AppConfig parsed;
    if (!parseConfig(buffer.str(), parsed)) return config;

    RLOG_INFO("config", "Loaded: product_id=0x%04x, chunk=%d, quiet=%dms/%dms, log=%s",
              parsed.usb.product_id, parsed.usb.read_chunk_size,
              parsed.session.quiet_interval_ms, parsed.session.transfer_quiet_interval_ms,
              parsed.log.log_path.empty() ? "stderr" : parsed.log.log_path.c_str());
    return parsed;
}

void applyEnvironmentOverrides(AppConfig& config) {
    if (const char* level = std::getenv("RECDOCK_LOG_LEVEL")) {
        config.log.level = level;
    }
    if (const char* path = std::getenv("RECDOCK_LOG_PATH")) {
        config.log.log_path = path;
    }
    if (const char* pid = std::getenv("RECDOCK_PRODUCT_ID")) {
        unsigned long v = 0;
        if (parseUnsigned(pid, v) && v <= 0xFFFF) {
            config.usb.product_id = static_cast<int>(v);
        } else {
            RLOG_WARN("config", "Ignoring RECDOCK_PRODUCT_ID=%s", pid);
        }
    }
}

void applyLogConfig(const LogConfig& log) {
    log::Level level = log::Level::Info;
    if (log::parseLevel(log.level, level)) {
        log::setLogLevel(level);
    } else {
        RLOG_WARN("config", "Unknown log level '%s', keeping current", log.level.c_str());
    }
    if (!log.log_path.empty() && !log::openLogFile(log.log_path.c_str())) {
        RLOG_ERROR("config", "Cannot open log file %s", log.log_path.c_str());
    }
}

SessionOptions toSessionOptions(const AppConfig& config) {
    SessionOptions o;
    o.vendor_id = static_cast<uint16_t>(config.usb.vendor_id);
    o.product_id = static_cast<uint16_t>(config.usb.product_id);
    o.endpoint_out = static_cast<uint8_t>(config.usb.endpoint_out);
    o.endpoint_in = static_cast<uint8_t>(config.usb.endpoint_in);
    o.interface_number = config.usb.interface_number;
    o.configuration = config.usb.configuration;
    if (config.usb.read_chunk_size > 0) {
        o.read_chunk_size = static_cast<size_t>(config.usb.read_chunk_size);
    }

    o.quiet_interval = std::chrono::milliseconds(config.session.quiet_interval_ms);
    o.transfer_quiet_interval = std::chrono::milliseconds(config.session.transfer_quiet_interval_ms);
    if (config.session.flush_threshold_bytes > 0) {
        o.flush_threshold_bytes = static_cast<size_t>(config.session.flush_threshold_bytes);
    }
    if (config.session.max_buffer_bytes > 0) {
        o.max_buffer_bytes = static_cast<size_t>(config.session.max_buffer_bytes);
    }
    o.health_poll_interval = std::chrono::milliseconds(config.session.health_poll_interval_ms);

    o.timeouts.device_info = seconds(config.timeouts.device_info);
    o.timeouts.file_count = seconds(config.timeouts.file_count);
    o.timeouts.file_list = seconds(config.timeouts.file_list);
    o.timeouts.command = seconds(config.timeouts.command);
    o.timeouts.delete_file = seconds(config.timeouts.delete_file);
    o.timeouts.format_card = seconds(config.timeouts.format_card);
    o.timeouts.bluetooth_scan = seconds(config.timeouts.bluetooth_scan);
    o.timeouts.firmware = seconds(config.timeouts.firmware);
    return o;
}

} // namespace config
} // namespace recdock
