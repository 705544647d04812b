// =============================================================================
// recdock - Receive Assembler
// =============================================================================
// Rolling receive buffer between the transport read loop and the correlator.
// Bytes are appended on every read and decoded after a quiet period with no
// further reads (or at once when the buffer passes the flush threshold).
//
// A sync mismatch discards everything buffered: the stream has no other
// resynchronization point.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include "frame_codec.hpp"
#include "result.hpp"
#include "task_scheduler.hpp"

namespace recdock {

class ReceiveAssembler {
public:
    using MessageSink = std::function<void(const protocol::Message&)>;
    using ErrorSink = std::function<void(const ProtocolError&)>;

    ReceiveAssembler(TaskScheduler& scheduler, size_t flush_threshold_bytes,
                     size_t max_buffer_bytes);

    ReceiveAssembler(const ReceiveAssembler&) = delete;
    ReceiveAssembler& operator=(const ReceiveAssembler&) = delete;

    void set_message_sink(MessageSink sink) { message_sink_ = std::move(sink); }
    void set_error_sink(ErrorSink sink) { error_sink_ = std::move(sink); }

    // Appends bytes and re-arms the decode timer with `quiet`.
    void feed(const uint8_t* data, size_t len, std::chrono::milliseconds quiet);

    // Decodes every complete frame now; messages are delivered in stream order.
    void flush();

    // Drops buffered bytes and any armed decode.
    void clear();

    size_t buffered() const;
    uint64_t frames_decoded() const { return frames_decoded_.load(); }
    uint64_t resyncs() const { return resyncs_.load(); }

private:
    const size_t flush_threshold_;
    const size_t max_buffer_;

    mutable std::mutex buffer_mutex_;
    std::vector<uint8_t> buffer_;

    // Serializes flush() so that sinks see messages in order.
    std::mutex flush_mutex_;

    MessageSink message_sink_;
    ErrorSink error_sink_;
    Debouncer debounce_;

    std::atomic<uint64_t> frames_decoded_{0};
    std::atomic<uint64_t> resyncs_{0};
};

} // namespace recdock
