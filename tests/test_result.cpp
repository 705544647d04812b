// =============================================================================
// recdock - Result Type Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vector>
#include "result.hpp"

using namespace recdock;

namespace {

Result<uint32_t, ProtocolError> parse_count(const std::vector<uint8_t>& body) {
    if (body.empty()) return 0u;
    if (body.size() < 4) {
        return protocolError(ProtocolError::Kind::MalformedResponse, "short count", 2);
    }
    return (uint32_t(body[0]) << 24) | (uint32_t(body[1]) << 16) |
           (uint32_t(body[2]) << 8) | body[3];
}

} // anonymous namespace

// =============================================================================
// Basic Ok/Err
// =============================================================================

TEST(ResultTest, OkCreation) {
    Result<int, Error> result = Ok(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrCreation) {
    Result<int, Error> result = Err<int>("Something went wrong", 500);

    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "Something went wrong");
    EXPECT_EQ(result.error().code, 500);
}

TEST(ResultTest, BoolConversion) {
    Result<int, Error> ok = Ok(1);
    Result<int, Error> err = Err<int>("error");

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, AccessorsThrowOnWrongSide) {
    Result<int, Error> ok = Ok(42);
    Result<int, Error> err = Err<int>("error");

    EXPECT_THROW(err.value(), std::runtime_error);
    EXPECT_THROW(ok.error(), std::runtime_error);
    EXPECT_EQ(ok.value_or(0), 42);
    EXPECT_EQ(err.value_or(0), 0);
}

TEST(ResultTest, OptionalStyleAccess) {
    Result<int, Error> ok = Ok(42);
    Result<int, Error> err = Err<int>("error");

    ASSERT_TRUE(ok.ok().has_value());
    EXPECT_EQ(*ok.ok(), 42);
    EXPECT_FALSE(err.ok().has_value());
    ASSERT_TRUE(err.err().has_value());
    EXPECT_EQ(err.err()->message, "error");
}

// =============================================================================
// Map
// =============================================================================

TEST(ResultTest, MapSuccessAndError) {
    Result<int, Error> ok = Ok(10);
    Result<int, Error> err = Err<int>("original error");

    auto doubled = ok.map([](int x) { return x * 2; });
    auto untouched = err.map([](int x) { return x * 2; });

    EXPECT_EQ(doubled.value(), 20);
    EXPECT_EQ(untouched.error().message, "original error");
}

TEST(ResultTest, MapErrWrapsMessage) {
    Result<int, Error> result = Err<int>("original");

    auto mapped = result.map_err([](const Error& e) {
        return Error("wrapped: " + e.message, e.code);
    });

    EXPECT_EQ(mapped.error().message, "wrapped: original");
}

// =============================================================================
// Void
// =============================================================================

TEST(ResultTest, VoidOkAndErr) {
    Result<void, ProtocolError> ok;
    Result<void, ProtocolError> err =
        protocolError(ProtocolError::Kind::NotConnected, "no device");

    EXPECT_TRUE(ok.is_ok());
    EXPECT_NO_THROW(ok.value());
    EXPECT_TRUE(err.is_err());
    EXPECT_THROW(err.value(), std::runtime_error);
    EXPECT_EQ(err.error().kind, ProtocolError::Kind::NotConnected);
}

// =============================================================================
// ProtocolError
// =============================================================================

TEST(ResultTest, ProtocolErrorCarriesKindAndCode) {
    Result<int, ProtocolError> result =
        protocolError(ProtocolError::Kind::Transport, "LIBUSB_ERROR_NO_DEVICE", -4);

    EXPECT_EQ(result.error().kind, ProtocolError::Kind::Transport);
    EXPECT_EQ(result.error().code, -4);
    EXPECT_EQ(result.error().message, "LIBUSB_ERROR_NO_DEVICE");
}

TEST(ResultTest, KindNames) {
    EXPECT_STREQ(kindName(ProtocolError::Kind::Timeout), "timeout");
    EXPECT_STREQ(kindName(ProtocolError::Kind::Unsupported), "unsupported");
    EXPECT_STREQ(kindName(ProtocolError::Kind::MalformedResponse), "malformed-response");
    EXPECT_STREQ(kindName(ProtocolError::Kind::Cancelled), "cancelled");
}

TEST(ResultTest, FunctionReturn) {
    auto empty = parse_count({});
    auto full = parse_count({0x00, 0x00, 0x01, 0x02});
    auto shorty = parse_count({0x01});

    EXPECT_EQ(empty.value(), 0u);
    EXPECT_EQ(full.value(), 258u);
    ASSERT_TRUE(shorty.is_err());
    EXPECT_EQ(shorty.error().kind, ProtocolError::Kind::MalformedResponse);
}

TEST(ResultTest, ChainedMap) {
    auto result = parse_count({0x00, 0x00, 0x00, 0x20})
        .map([](uint32_t x) { return x + 10; })
        .map([](uint32_t x) { return x * 2; });

    EXPECT_EQ(result.value(), 84u);  // (32 + 10) * 2
}

TEST(ResultTest, MoveOutValue) {
    Result<std::vector<uint8_t>, ProtocolError> result = std::vector<uint8_t>{1, 2, 3};

    std::vector<uint8_t> value = std::move(result).value();

    EXPECT_EQ(value.size(), 3u);
}
