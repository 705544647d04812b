// =============================================================================
// Unit tests for ReceiveAssembler (quiet-period decode, split frames, resync)
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <vector>
#include "manual_scheduler.hpp"
#include "receive_assembler.hpp"

using namespace recdock;
using namespace recdock::protocol;
using recdock::test::ManualScheduler;
using std::chrono::milliseconds;

namespace {

std::vector<uint8_t> frame(Command cmd, uint32_t seq, const std::vector<uint8_t>& body) {
    return encode_frame(cmd, seq, body).value();
}

struct AssemblerFixture : public ::testing::Test {
    ManualScheduler scheduler;
    ReceiveAssembler assembler{scheduler, 1024, 4096};
    std::vector<Message> messages;
    std::vector<ProtocolError> errors;

    void SetUp() override {
        assembler.set_message_sink([this](const Message& m) { messages.push_back(m); });
        assembler.set_error_sink([this](const ProtocolError& e) { errors.push_back(e); });
    }

    void feed(const std::vector<uint8_t>& bytes, milliseconds quiet = milliseconds(10)) {
        assembler.feed(bytes.data(), bytes.size(), quiet);
    }
};

} // anonymous namespace

// ===========================================================================
// Quiet period
// ===========================================================================
TEST_F(AssemblerFixture, DecodesOnlyAfterQuietPeriod) {
    feed(frame(Command::GetDeviceTime, 1, {0x20, 0x24}));

    scheduler.advance(milliseconds(9));
    EXPECT_TRUE(messages.empty());

    scheduler.advance(milliseconds(1));
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].sequence, 1u);
    EXPECT_EQ(assembler.buffered(), 0u);
}

TEST_F(AssemblerFixture, EachReadRearmsTheTimer) {
    auto bytes = frame(Command::GetSettings, 3, std::vector<uint8_t>(16, 1));
    std::vector<uint8_t> head(bytes.begin(), bytes.begin() + 10);
    std::vector<uint8_t> tail(bytes.begin() + 10, bytes.end());

    feed(head);
    scheduler.advance(milliseconds(8));
    feed(tail);
    scheduler.advance(milliseconds(8));
    EXPECT_TRUE(messages.empty());

    scheduler.advance(milliseconds(2));
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].body.size(), 16u);
}

TEST_F(AssemblerFixture, TransferQuietIntervalHonoured) {
    feed(frame(Command::TransferFile, 1, {1, 2, 3}), milliseconds(1000));
    scheduler.advance(milliseconds(999));
    EXPECT_TRUE(messages.empty());
    scheduler.advance(milliseconds(1));
    EXPECT_EQ(messages.size(), 1u);
}

// ===========================================================================
// Stream splitting
// ===========================================================================
TEST_F(AssemblerFixture, ArbitrarySplitsYieldSameOrderedMessages) {
    std::vector<uint8_t> stream;
    for (uint32_t seq = 0; seq < 5; seq++) {
        auto f = frame(Command::GetFileList, seq, std::vector<uint8_t>(seq * 7, uint8_t(seq)));
        stream.insert(stream.end(), f.begin(), f.end());
    }

    for (size_t step : {1u, 3u, 11u, 12u, 13u, 64u}) {
        messages.clear();
        for (size_t pos = 0; pos < stream.size(); pos += step) {
            size_t n = std::min(step, stream.size() - pos);
            assembler.feed(stream.data() + pos, n, milliseconds(10));
            // flush opportunistically mid-stream; partial frames must survive
            if (pos % 2 == 0) assembler.flush();
        }
        scheduler.advance(milliseconds(10));

        ASSERT_EQ(messages.size(), 5u) << "step " << step;
        for (uint32_t seq = 0; seq < 5; seq++) {
            EXPECT_EQ(messages[seq].sequence, seq);
            EXPECT_EQ(messages[seq].body.size(), seq * 7);
        }
        EXPECT_EQ(assembler.buffered(), 0u);
    }
}

TEST_F(AssemblerFixture, PartialFrameStaysBuffered) {
    auto f = frame(Command::GetDeviceInfo, 9, std::vector<uint8_t>(20, 0x41));
    feed(std::vector<uint8_t>(f.begin(), f.begin() + 15));
    scheduler.advance(milliseconds(10));

    EXPECT_TRUE(messages.empty());
    EXPECT_EQ(assembler.buffered(), 15u);
    EXPECT_TRUE(errors.empty());
}

// ===========================================================================
// Resync / thresholds
// ===========================================================================
TEST_F(AssemblerFixture, BadSyncDropsBufferAndReportsOnce) {
    auto good = frame(Command::GetDeviceTime, 1, {});
    std::vector<uint8_t> stream = good;
    stream.insert(stream.end(), {0xDE, 0xAD, 0xBE, 0xEF, 0, 0, 0, 0, 0, 0, 0, 0});
    auto after = frame(Command::GetFileCount, 2, {});
    stream.insert(stream.end(), after.begin(), after.end());

    feed(stream);
    scheduler.advance(milliseconds(10));

    ASSERT_EQ(messages.size(), 1u);  // frames ahead of the bad sync still delivered
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ProtocolError::Kind::InvalidFrame);
    EXPECT_EQ(assembler.buffered(), 0u);
    EXPECT_EQ(assembler.resyncs(), 1u);

    // stream continues cleanly afterwards
    feed(frame(Command::GetFileCount, 3, {0, 0, 0, 1}));
    scheduler.advance(milliseconds(10));
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].sequence, 3u);
}

TEST_F(AssemblerFixture, ThresholdFlushesWithoutWaiting) {
    feed(frame(Command::TransferFile, 1, std::vector<uint8_t>(1100, 0x55)), milliseconds(1000));

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(AssemblerFixture, OverflowDropsBuffer) {
    // declared length larger than the cap, delivered in small pieces
    std::vector<uint8_t> header = {0x12, 0x34, 0x00, 0x05, 0, 0, 0, 1, 0x00, 0x00, 0x20, 0x00};
    feed(header);
    std::vector<uint8_t> filler(1000, 0x00);
    for (int i = 0; i < 5; i++) feed(filler);

    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0].kind, ProtocolError::Kind::InvalidFrame);
    EXPECT_LT(assembler.buffered(), 4096u);
}

TEST_F(AssemblerFixture, ClearCancelsPendingDecode) {
    feed(frame(Command::GetDeviceTime, 1, {}));
    assembler.clear();
    scheduler.advance(milliseconds(50));
    EXPECT_TRUE(messages.empty());
    EXPECT_EQ(assembler.buffered(), 0u);
}
