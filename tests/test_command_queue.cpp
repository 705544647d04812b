// =============================================================================
// Unit tests for CommandQueue (single-flight FIFO, correlation, timeouts)
// =============================================================================
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <string>
#include <vector>
#include "command_queue.hpp"
#include "manual_scheduler.hpp"

using namespace recdock;
using namespace recdock::protocol;
using recdock::test::ManualScheduler;
using std::chrono::milliseconds;

namespace {

bool ready(const std::future<Reply>& f) {
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// Writes are captured; replies are raw bodies. A body of [0xEE] means
// "more frames follow".
struct QueueFixture : public ::testing::Test {
    ManualScheduler scheduler;
    std::vector<Message> wire;
    bool fail_writes = false;

    CommandQueue queue{
        scheduler,
        [this](const std::vector<uint8_t>& frame) -> Result<size_t, ProtocolError> {
            if (fail_writes) return protocolError(ProtocolError::Kind::Transport, "write failed");
            auto r = try_decode(frame.data(), frame.size());
            EXPECT_EQ(r.status, DecodeStatus::Ok);
            wire.push_back(r.message);
            return frame.size();
        },
        [](const PendingOperation&, const Message& msg) -> std::optional<Reply> {
            if (msg.body == std::vector<uint8_t>{0xEE}) return std::nullopt;
            return Reply(ResponseValue(RawBody(msg.body)));
        }};

    void reply(Command cmd, uint32_t seq, std::vector<uint8_t> body) {
        queue.on_message(Message{to_wire(cmd), seq, std::move(body)});
    }
};

} // anonymous namespace

// ===========================================================================
// Ordering
// ===========================================================================
TEST_F(QueueFixture, SingleFlightFifo) {
    auto a = queue.send(Command::GetDeviceInfo);
    auto b = queue.send(Command::GetDeviceTime);
    auto c = queue.send(Command::GetFileCount);

    ASSERT_EQ(wire.size(), 1u);  // only the head is written
    EXPECT_EQ(wire[0].id, to_wire(Command::GetDeviceInfo));
    EXPECT_EQ(queue.queued(), 2u);

    reply(Command::GetDeviceInfo, 0, {1});
    ASSERT_EQ(wire.size(), 2u);
    EXPECT_EQ(wire[1].id, to_wire(Command::GetDeviceTime));

    reply(Command::GetDeviceTime, 1, {2});
    reply(Command::GetFileCount, 2, {3});

    ASSERT_EQ(wire.size(), 3u);
    EXPECT_EQ(std::get<RawBody>(a.get().value()), RawBody{1});
    EXPECT_EQ(std::get<RawBody>(b.get().value()), RawBody{2});
    EXPECT_EQ(std::get<RawBody>(c.get().value()), RawBody{3});
    EXPECT_TRUE(queue.idle());
}

TEST_F(QueueFixture, SequenceNumbersIncrementAndReset) {
    queue.send(Command::GetDeviceInfo);
    reply(Command::GetDeviceInfo, 0, {});
    queue.send(Command::GetDeviceInfo);
    reply(Command::GetDeviceInfo, 1, {});
    ASSERT_EQ(wire.size(), 2u);
    EXPECT_EQ(wire[0].sequence, 0u);
    EXPECT_EQ(wire[1].sequence, 1u);

    queue.reset_sequence();
    queue.send(Command::GetDeviceInfo);
    EXPECT_EQ(wire.back().sequence, 0u);
}

// ===========================================================================
// Correlation
// ===========================================================================
TEST_F(QueueFixture, MismatchedReplyDiscardedWithoutStateChange) {
    auto f = queue.send(Command::GetSettings);
    queue.send(Command::GetDeviceTime);

    reply(Command::GetDeviceTime, 1, {9});
    EXPECT_FALSE(ready(f));
    EXPECT_EQ(queue.discarded(), 1u);
    EXPECT_TRUE(queue.in_flight_command() == Command::GetSettings);
    EXPECT_EQ(queue.queued(), 1u);
    EXPECT_EQ(wire.size(), 1u);
}

TEST_F(QueueFixture, ReplyWithNothingInFlightDiscarded) {
    reply(Command::GetDeviceInfo, 5, {});
    EXPECT_EQ(queue.discarded(), 1u);
    EXPECT_TRUE(queue.idle());
}

TEST_F(QueueFixture, MultiFrameReplyKeepsOperationInFlight) {
    auto f = queue.send(Command::GetFileList);
    reply(Command::GetFileList, 0, {0xEE});
    reply(Command::GetFileList, 0, {0xEE});
    EXPECT_FALSE(ready(f));
    reply(Command::GetFileList, 0, {});
    ASSERT_TRUE(ready(f));
    EXPECT_TRUE(f.get().is_ok());
}

// ===========================================================================
// Timeouts
// ===========================================================================
TEST_F(QueueFixture, TimeoutFiresOnceAndUnblocksQueue) {
    int finished = 0;
    CommandQueue::SendOptions opts;
    opts.timeout = milliseconds(100);
    opts.on_finished = [&](const Reply&, bool) { finished++; };
    auto f = queue.send(Command::DeleteFile, {'a'}, std::move(opts));
    auto next = queue.send(Command::GetDeviceTime);

    scheduler.advance(milliseconds(99));
    EXPECT_FALSE(ready(f));
    scheduler.advance(milliseconds(1));
    ASSERT_TRUE(ready(f));
    auto r = f.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ProtocolError::Kind::Timeout);

    // next operation went out; a late reply for the timed-out one is dropped
    EXPECT_EQ(wire.back().id, to_wire(Command::GetDeviceTime));
    reply(Command::DeleteFile, 0, {0});
    EXPECT_EQ(queue.discarded(), 1u);

    scheduler.advance(milliseconds(1000));
    EXPECT_EQ(finished, 1);
}

TEST_F(QueueFixture, ResolvedOperationNeverTimesOut) {
    int finished = 0;
    CommandQueue::SendOptions opts;
    opts.timeout = milliseconds(50);
    opts.on_finished = [&](const Reply&, bool) { finished++; };
    auto f = queue.send(Command::GetDeviceInfo, {}, std::move(opts));

    reply(Command::GetDeviceInfo, 0, {1});
    scheduler.advance(milliseconds(500));

    EXPECT_TRUE(f.get().is_ok());
    EXPECT_EQ(finished, 1);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(QueueFixture, QueuedOperationExpiresWhileWaiting) {
    auto head = queue.send(Command::GetFileList);
    auto waiting = queue.send(Command::GetDeviceTime, {}, milliseconds(20));

    scheduler.advance(milliseconds(20));
    ASSERT_TRUE(ready(waiting));
    EXPECT_EQ(waiting.get().error().kind, ProtocolError::Kind::Timeout);

    reply(Command::GetFileList, 0, {});
    EXPECT_TRUE(head.get().is_ok());
    EXPECT_EQ(wire.size(), 1u);  // expired op was never written
}

// ===========================================================================
// Failures / cancellation
// ===========================================================================
TEST_F(QueueFixture, WriteFailureResolvesAndMovesOn) {
    fail_writes = true;
    auto f = queue.send(Command::GetDeviceInfo);
    ASSERT_TRUE(ready(f));
    EXPECT_EQ(f.get().error().kind, ProtocolError::Kind::Transport);
    EXPECT_TRUE(queue.idle());
}

TEST_F(QueueFixture, CancelAllResolvesEverything) {
    std::vector<bool> dispatched;
    CommandQueue::SendOptions opts;
    opts.on_finished = [&](const Reply&, bool d) { dispatched.push_back(d); };
    auto a = queue.send(Command::TransferFile, {'x'}, std::move(opts));
    CommandQueue::SendOptions opts2;
    opts2.on_finished = [&](const Reply&, bool d) { dispatched.push_back(d); };
    auto b = queue.send(Command::GetDeviceTime, {}, std::move(opts2));

    queue.cancel_all(protocolError(ProtocolError::Kind::Cancelled, "closed"));

    EXPECT_EQ(a.get().error().kind, ProtocolError::Kind::Cancelled);
    EXPECT_EQ(b.get().error().kind, ProtocolError::Kind::Cancelled);
    EXPECT_EQ(dispatched, (std::vector<bool>{true, false}));
    EXPECT_EQ(wire.size(), 1u);  // nothing pumped onto the wire while cancelling
    EXPECT_TRUE(queue.idle());
}

TEST_F(QueueFixture, CancelDuringDispatchSkipsWrite) {
    CommandQueue::SendOptions opts;
    opts.on_dispatch = [this] {
        queue.cancel_all(protocolError(ProtocolError::Kind::Cancelled, "closed"));
    };
    auto f = queue.send(Command::FormatCard, {1, 2, 3, 4}, std::move(opts));

    ASSERT_TRUE(ready(f));
    EXPECT_EQ(f.get().error().kind, ProtocolError::Kind::Cancelled);
    EXPECT_TRUE(wire.empty());
    EXPECT_TRUE(queue.idle());

    // the queue keeps working afterwards
    auto next = queue.send(Command::GetDeviceTime);
    ASSERT_EQ(wire.size(), 1u);
    EXPECT_EQ(wire[0].id, to_wire(Command::GetDeviceTime));
    reply(Command::GetDeviceTime, wire[0].sequence, {0x00});
    EXPECT_TRUE(next.get().is_ok());
}

TEST_F(QueueFixture, FailInFlightOnlyTouchesHead) {
    auto a = queue.send(Command::GetDeviceInfo);
    auto b = queue.send(Command::GetDeviceTime);

    queue.fail_in_flight(protocolError(ProtocolError::Kind::InvalidFrame, "resync"));
    EXPECT_EQ(a.get().error().kind, ProtocolError::Kind::InvalidFrame);
    EXPECT_FALSE(ready(b));
    EXPECT_TRUE(queue.in_flight_command() == Command::GetDeviceTime);
}

TEST_F(QueueFixture, DispatchAndWrittenHooks) {
    std::vector<std::string> events;
    CommandQueue::SendOptions opts;
    opts.on_dispatch = [&] { events.push_back("dispatch"); };
    opts.on_written = [&](size_t n) { events.push_back("written " + std::to_string(n)); };
    queue.send(Command::FirmwareUpload, std::vector<uint8_t>(100, 0), std::move(opts));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "dispatch");
    EXPECT_EQ(events[1], "written 112");
}
