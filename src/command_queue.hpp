// =============================================================================
// recdock - Command Queue & Correlator
// =============================================================================
// Single-flight FIFO of outgoing commands. At most one operation is in flight;
// an inbound message resolves it iff the command ids match, after which the
// next queued operation is written.
//
// Lifecycle of a PendingOperation:
//   send() -> queued -> in flight -> resolved (reply | timeout | error)
//                    \-> resolved while still queued (timeout | cancel)
// Every operation is resolved exactly once. The timeout is armed when the
// operation is queued and covers queueing plus the round trip.
//
// Threading: all state is guarded by one mutex. Frames are written and
// per-operation hooks run outside it.
// =============================================================================
#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "frame_codec.hpp"
#include "response_types.hpp"
#include "result.hpp"
#include "task_scheduler.hpp"

namespace recdock {

using Reply = Result<ResponseValue, ProtocolError>;

struct PendingOperation {
    protocol::Command command = protocol::Command::Invalid;
    uint32_t sequence = 0;
    std::vector<uint8_t> body;
    std::optional<TaskScheduler::Clock::time_point> expiry;

    // Called just before the frame is written (operation became in flight).
    std::function<void()> on_dispatch;
    // Progress sink: called with the frame size once the write succeeded.
    std::function<void(size_t)> on_written;
    // Called once with the final result; `dispatched` tells whether the
    // operation ever reached the wire.
    std::function<void(const Reply&, bool dispatched)> on_finished;

    // Guarded by the owning queue's mutex.
    std::promise<Reply> promise;
    bool resolved = false;
    bool dispatched = false;
    TaskId timeout_task = INVALID_TASK;
};

class CommandQueue {
public:
    // Writes one encoded frame to the device.
    using Writer = std::function<Result<size_t, ProtocolError>(const std::vector<uint8_t>&)>;
    // Turns a matched message into a result, or nullopt to keep waiting for
    // more frames (multi-frame replies).
    using Decoder = std::function<std::optional<Reply>(const PendingOperation&,
                                                       const protocol::Message&)>;

    struct SendOptions {
        std::optional<std::chrono::milliseconds> timeout;
        std::function<void()> on_dispatch;
        std::function<void(size_t)> on_written;
        std::function<void(const Reply&, bool)> on_finished;
    };

    CommandQueue(TaskScheduler& scheduler, Writer writer, Decoder decoder);
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    std::future<Reply> send(protocol::Command command, std::vector<uint8_t> body,
                            SendOptions options);

    std::future<Reply> send(protocol::Command command, std::vector<uint8_t> body = {},
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        SendOptions options;
        options.timeout = timeout;
        return send(command, std::move(body), std::move(options));
    }

    // Correlates one decoded message with the in-flight operation.
    void on_message(const protocol::Message& msg);

    // Resolves the in-flight operation (if any) with `error`.
    void fail_in_flight(const ProtocolError& error);

    // Resolves every queued and in-flight operation with `error`.
    void cancel_all(const ProtocolError& error);

    // Next sequence number becomes 0.
    void reset_sequence();

    std::optional<protocol::Command> in_flight_command() const;
    size_t queued() const;
    bool idle() const;

    uint64_t discarded() const;

private:
    using OpPtr = std::shared_ptr<PendingOperation>;

    void pump();
    void on_timeout(const OpPtr& op);
    // Resolves `op` unless already resolved; pumps when it was in flight.
    void finish(const OpPtr& op, Reply reply);

    TaskScheduler& scheduler_;
    Writer writer_;
    Decoder decoder_;

    mutable std::mutex mutex_;
    std::deque<OpPtr> queue_;
    OpPtr in_flight_;
    uint32_t next_sequence_ = 0;
    uint64_t discarded_ = 0;
};

} // namespace recdock
