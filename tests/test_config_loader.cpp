// =============================================================================
// Unit tests for recdock_config.hpp
// Tests: defaults, file loading, type mismatches, env overrides, session options
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "recdock_config.hpp"

using namespace recdock;
using namespace recdock::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.usb.vendor_id, 0x10D6);
    EXPECT_EQ(cfg.usb.product_id, 0);
    EXPECT_EQ(cfg.usb.endpoint_out, 0x01);
    EXPECT_EQ(cfg.usb.endpoint_in, 0x82);
    EXPECT_EQ(cfg.usb.read_chunk_size, 51200);
    EXPECT_EQ(cfg.session.quiet_interval_ms, 10);
    EXPECT_EQ(cfg.session.transfer_quiet_interval_ms, 1000);
    EXPECT_EQ(cfg.timeouts.file_list, 20);
    EXPECT_EQ(cfg.log.level, "info");
    EXPECT_TRUE(cfg.log.log_path.empty());
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_recdock_xyz.json", true);
    EXPECT_EQ(cfg.usb.read_chunk_size, 51200);
    EXPECT_EQ(cfg.timeouts.command, 5);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadFromFile) {
    const char* path = "__test_recdock_config.json";
    writeTmpJson(path, R"({
        "usb": { "product_id": 45069, "read_chunk_size": 4096 },
        "session": { "quiet_interval_ms": 25 },
        "timeouts": { "file_list": 40 },
        "log": { "log_path": "out.log", "level": "debug" }
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.usb.product_id, 45069);
    EXPECT_EQ(cfg.usb.read_chunk_size, 4096);
    EXPECT_EQ(cfg.session.quiet_interval_ms, 25);
    EXPECT_EQ(cfg.session.transfer_quiet_interval_ms, 1000);  // untouched
    EXPECT_EQ(cfg.timeouts.file_list, 40);
    EXPECT_EQ(cfg.log.log_path, "out.log");
    EXPECT_EQ(cfg.log.level, "debug");

    std::remove(path);
}

TEST(ConfigLoaderTest, WrongTypeKeepsDefault) {
    AppConfig cfg;
    ASSERT_TRUE(parseConfig(R"({"usb": {"product_id": "p1", "read_chunk_size": 1024}})", cfg));
    EXPECT_EQ(cfg.usb.product_id, 0);
    EXPECT_EQ(cfg.usb.read_chunk_size, 1024);
}

TEST(ConfigLoaderTest, InvalidJsonRejected) {
    AppConfig cfg;
    EXPECT_FALSE(parseConfig("{ not json", cfg));
    EXPECT_FALSE(parseConfig("[1, 2, 3]", cfg));
    EXPECT_EQ(cfg.usb.read_chunk_size, 51200);
}

TEST(ConfigLoaderTest, JsonGetHelper) {
    auto j = nlohmann::json::parse(R"({"a": {"n": 7, "s": "x"}})");
    EXPECT_EQ(jsonGet<int>(j, "a", "n", 0), 7);
    EXPECT_EQ(jsonGet<int>(j, "a", "missing", 3), 3);
    EXPECT_EQ(jsonGet<int>(j, "b", "n", 4), 4);
    EXPECT_EQ(jsonGet<int>(j, "a", "s", 5), 5);
    EXPECT_EQ(jsonGet<std::string>(j, "a", "s", ""), "x");
}

// ---------------------------------------------------------------------------
// Environment overrides
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, EnvironmentOverrides) {
    setenv("RECDOCK_LOG_LEVEL", "trace", 1);
    setenv("RECDOCK_PRODUCT_ID", "0xB00D", 1);

    AppConfig cfg;
    applyEnvironmentOverrides(cfg);
    EXPECT_EQ(cfg.log.level, "trace");
    EXPECT_EQ(cfg.usb.product_id, 0xB00D);

    setenv("RECDOCK_PRODUCT_ID", "banana", 1);
    AppConfig bad;
    applyEnvironmentOverrides(bad);
    EXPECT_EQ(bad.usb.product_id, 0);

    unsetenv("RECDOCK_LOG_LEVEL");
    unsetenv("RECDOCK_PRODUCT_ID");
}

// ---------------------------------------------------------------------------
// Session options
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ToSessionOptions) {
    AppConfig cfg;
    cfg.usb.product_id = 0xAF0D;
    cfg.session.quiet_interval_ms = 15;
    cfg.timeouts.format_card = 90;

    SessionOptions o = toSessionOptions(cfg);
    EXPECT_EQ(o.vendor_id, 0x10D6);
    EXPECT_EQ(o.product_id, 0xAF0D);
    EXPECT_EQ(o.endpoint_in, 0x82);
    EXPECT_EQ(o.quiet_interval, std::chrono::milliseconds(15));
    EXPECT_EQ(o.timeouts.format_card, std::chrono::milliseconds(90000));
    EXPECT_EQ(o.timeouts.command, std::chrono::milliseconds(5000));
    EXPECT_FALSE(o.timeouts.transfer.has_value());
}
