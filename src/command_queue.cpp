#include "command_queue.hpp"
#include <algorithm>
#include "recdock_log.hpp"

namespace recdock {

using protocol::Command;
using protocol::cmd_name;

CommandQueue::CommandQueue(TaskScheduler& scheduler, Writer writer, Decoder decoder)
    : scheduler_(scheduler), writer_(std::move(writer)), decoder_(std::move(decoder)) {}

CommandQueue::~CommandQueue() {
    cancel_all(protocolError(ProtocolError::Kind::Cancelled, "command queue destroyed"));
}

std::future<Reply> CommandQueue::send(Command command, std::vector<uint8_t> body,
                                      SendOptions options) {
    auto op = std::make_shared<PendingOperation>();
    op->command = command;
    op->body = std::move(body);
    op->on_dispatch = std::move(options.on_dispatch);
    op->on_written = std::move(options.on_written);
    op->on_finished = std::move(options.on_finished);
    std::future<Reply> future = op->promise.get_future();

    if (op->body.size() > protocol::MAX_BODY_LEN) {
        RLOG_ERROR("cmdq", "%s body too large: %zu bytes", cmd_name(command), op->body.size());
        Reply reply(protocolError(ProtocolError::Kind::InvalidArgument,
                                  "frame body exceeds 24-bit length"));
        op->resolved = true;
        if (op->on_finished) op->on_finished(reply, false);
        op->promise.set_value(std::move(reply));
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        op->sequence = next_sequence_++;
        if (options.timeout) {
            op->expiry = scheduler_.now() + *options.timeout;
            std::weak_ptr<PendingOperation> weak = op;
            op->timeout_task = scheduler_.schedule_after(*options.timeout, [this, weak] {
                if (auto locked = weak.lock()) on_timeout(locked);
            });
        }
        queue_.push_back(op);
        RLOG_DEBUG("cmdq", "Queued %s seq=%u body=%zu (queue=%zu)",
                   cmd_name(command), op->sequence, op->body.size(), queue_.size());
    }

    pump();
    return future;
}

void CommandQueue::pump() {
    for (;;) {
        OpPtr op;
        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_flight_ || queue_.empty()) return;
            op = queue_.front();
            queue_.pop_front();
            if (op->resolved) continue;

            if (op->expiry && scheduler_.now() >= *op->expiry) {
                expired = true;
            } else {
                in_flight_ = op;
                op->dispatched = true;
            }
        }

        if (expired) {
            RLOG_WARN("cmdq", "%s seq=%u expired before send", cmd_name(op->command), op->sequence);
            finish(op, Reply(protocolError(ProtocolError::Kind::Timeout, "expired before send")));
            continue;
        }

        if (op->on_dispatch) op->on_dispatch();

        {
            // cancelled while dispatching: the frame must not reach the device
            std::lock_guard<std::mutex> lock(mutex_);
            if (op->resolved || in_flight_ != op) {
                RLOG_DEBUG("cmdq", "%s seq=%u cancelled before write",
                           cmd_name(op->command), op->sequence);
                continue;
            }
        }

        auto frame = protocol::encode_frame(op->command, op->sequence, op->body);
        if (frame.is_err()) {
            finish(op, Reply(frame.error()));
            continue;
        }

        RLOG_DEBUG("cmdq", "Send %s seq=%u (%zu bytes)",
                   cmd_name(op->command), op->sequence, frame.value().size());
        auto written = writer_(frame.value());
        if (written.is_err()) {
            RLOG_ERROR("cmdq", "Write failed for %s seq=%u: %s",
                       cmd_name(op->command), op->sequence, written.error().message.c_str());
            finish(op, Reply(written.error()));
            continue;
        }

        if (op->on_written) op->on_written(written.value());
        return;
    }
}

void CommandQueue::on_message(const protocol::Message& msg) {
    OpPtr op;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        op = in_flight_;
        if (!op || protocol::to_wire(op->command) != msg.id) {
            discarded_++;
            RLOG_DEBUG("cmdq", "Discarded reply id=%u seq=%u (in flight: %s)",
                       msg.id, msg.sequence, op ? cmd_name(op->command) : "none");
            return;
        }
    }

    auto outcome = decoder_(*op, msg);
    if (!outcome) return;  // multi-frame reply, keep waiting
    finish(op, std::move(*outcome));
}

void CommandQueue::on_timeout(const OpPtr& op) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (op->resolved) return;
        op->timeout_task = INVALID_TASK;  // this task is running now
    }
    RLOG_WARN("cmdq", "%s seq=%u timed out", cmd_name(op->command), op->sequence);
    finish(op, Reply(protocolError(ProtocolError::Kind::Timeout,
                                   std::string(cmd_name(op->command)) + " timed out")));
}

void CommandQueue::finish(const OpPtr& op, Reply reply) {
    bool was_in_flight = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (op->resolved) return;
        op->resolved = true;
        if (op->timeout_task != INVALID_TASK) {
            scheduler_.cancel(op->timeout_task);
            op->timeout_task = INVALID_TASK;
        }
        if (in_flight_ == op) {
            in_flight_.reset();
            was_in_flight = true;
        } else {
            auto it = std::find(queue_.begin(), queue_.end(), op);
            if (it != queue_.end()) queue_.erase(it);
        }
    }

    if (reply.is_err()) {
        RLOG_DEBUG("cmdq", "%s seq=%u failed: %s (%s)", cmd_name(op->command), op->sequence,
                   kindName(reply.error().kind), reply.error().message.c_str());
    } else {
        RLOG_DEBUG("cmdq", "%s seq=%u resolved", cmd_name(op->command), op->sequence);
    }

    if (op->on_finished) op->on_finished(reply, op->dispatched);
    op->promise.set_value(std::move(reply));

    if (was_in_flight) pump();
}

void CommandQueue::fail_in_flight(const ProtocolError& error) {
    OpPtr op;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        op = in_flight_;
    }
    if (op) finish(op, Reply(error));
}

void CommandQueue::cancel_all(const ProtocolError& error) {
    std::vector<OpPtr> ops;
    {
        // detach everything first so finish() never pumps a victim onto the wire
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_) ops.push_back(std::move(in_flight_));
        in_flight_.reset();
        for (auto& op : queue_) ops.push_back(op);
        queue_.clear();
    }
    if (!ops.empty()) {
        RLOG_INFO("cmdq", "Cancelling %zu operation(s): %s", ops.size(), error.message.c_str());
    }
    for (auto& op : ops) finish(op, Reply(error));
}

void CommandQueue::reset_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    next_sequence_ = 0;
}

std::optional<Command> CommandQueue::in_flight_command() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_) return std::nullopt;
    return in_flight_->command;
}

size_t CommandQueue::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool CommandQueue::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !in_flight_ && queue_.empty();
}

uint64_t CommandQueue::discarded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

} // namespace recdock
