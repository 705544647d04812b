// =============================================================================
// Unit tests for StreamingTransfer (byte-count completion, progress, failure)
// =============================================================================
#include <gtest/gtest.h>
#include <vector>
#include "streaming_transfer.hpp"

using namespace recdock;
using namespace recdock::protocol;

namespace {

struct ProgressLog {
    std::vector<TransferProgress> events;
    ProgressCallback callback() {
        return [this](const TransferProgress& p) { events.push_back(p); };
    }
};

} // anonymous namespace

TEST(StreamingTransfer, CompletesWhenExpectedBytesArrive) {
    ProgressLog log;
    StreamingTransfer t(Command::TransferFile, "a.hda", 10, log.callback());

    EXPECT_EQ(t.on_chunk({1, 2, 3, 4}), StreamingTransfer::State::Active);
    EXPECT_EQ(t.on_chunk({5, 6, 7, 8}), StreamingTransfer::State::Active);
    EXPECT_EQ(t.on_chunk({9, 10}), StreamingTransfer::State::Completed);

    ASSERT_EQ(log.events.size(), 3u);
    EXPECT_EQ(log.events[0].received, 4u);
    EXPECT_EQ(log.events[2].received, 10u);
    EXPECT_EQ(log.events[2].expected, 10u);
    EXPECT_FALSE(log.events[2].failed);

    auto summary = t.take_summary();
    EXPECT_EQ(summary.filename, "a.hda");
    EXPECT_EQ(summary.received, 10u);
    EXPECT_EQ(summary.data, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
}

TEST(StreamingTransfer, ChunksAfterCompletionIgnored) {
    StreamingTransfer t(Command::GetFileBlock, "b.hda", 2);
    t.on_chunk({1, 2});
    EXPECT_EQ(t.on_chunk({3}), StreamingTransfer::State::Completed);
    EXPECT_EQ(t.received(), 2u);
    EXPECT_FALSE(t.fail("late"));
}

TEST(StreamingTransfer, EmptyChunkIsDeviceFailure) {
    ProgressLog log;
    StreamingTransfer t(Command::TransferFile, "c.hda", 100, log.callback());
    t.on_chunk(std::vector<uint8_t>(40, 0));

    EXPECT_EQ(t.on_chunk({}), StreamingTransfer::State::Failed);
    EXPECT_EQ(t.state(), StreamingTransfer::State::Failed);
    EXPECT_FALSE(t.failure_reason().empty());

    ASSERT_EQ(log.events.size(), 2u);
    EXPECT_TRUE(log.events[1].failed);
    EXPECT_EQ(log.events[1].received, 40u);
}

TEST(StreamingTransfer, FailReportsExactlyOnce) {
    ProgressLog log;
    StreamingTransfer t(Command::ReadFile, "d.hda", 100, log.callback());

    EXPECT_TRUE(t.fail("device disconnected"));
    EXPECT_FALSE(t.fail("again"));
    EXPECT_EQ(t.failure_reason(), "device disconnected");

    ASSERT_EQ(log.events.size(), 1u);
    EXPECT_TRUE(log.events[0].failed);
}

TEST(StreamingTransfer, ChunkSinkBypassesBuffer) {
    std::vector<uint8_t> sink;
    StreamingTransfer t(Command::TransferFile, "e.hda", 4, {},
                        [&](const uint8_t* d, size_t n) { sink.insert(sink.end(), d, d + n); });
    t.on_chunk({1, 2});
    t.on_chunk({3, 4});

    EXPECT_EQ(sink, (std::vector<uint8_t>{1, 2, 3, 4}));
    EXPECT_TRUE(t.take_summary().data.empty());
}
