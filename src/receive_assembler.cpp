#include "receive_assembler.hpp"
#include "recdock_log.hpp"

namespace recdock {

ReceiveAssembler::ReceiveAssembler(TaskScheduler& scheduler, size_t flush_threshold_bytes,
                                   size_t max_buffer_bytes)
    : flush_threshold_(flush_threshold_bytes),
      max_buffer_(max_buffer_bytes),
      debounce_(scheduler, [this] { flush(); }) {}

void ReceiveAssembler::feed(const uint8_t* data, size_t len, std::chrono::milliseconds quiet) {
    if (!data || len == 0) return;

    bool overflow = false;
    bool flush_now = false;
    size_t size = 0;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        buffer_.insert(buffer_.end(), data, data + len);
        size = buffer_.size();
        if (size > max_buffer_) {
            buffer_.clear();
            overflow = true;
        } else {
            flush_now = size >= flush_threshold_;
        }
    }

    if (overflow) {
        debounce_.cancel();
        resyncs_++;
        RLOG_ERROR("assembler", "Receive buffer exceeded %zu bytes, dropped %zu", max_buffer_, size);
        if (error_sink_) {
            error_sink_(protocolError(ProtocolError::Kind::InvalidFrame,
                                      "receive buffer overflow"));
        }
        return;
    }

    if (flush_now) {
        debounce_.cancel();
        flush();
        return;
    }
    debounce_.trigger(quiet);
}

void ReceiveAssembler::flush() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    std::vector<protocol::Message> messages;
    bool invalid = false;
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        size_t offset = 0;
        while (offset < buffer_.size()) {
            auto r = protocol::try_decode(buffer_.data(), buffer_.size(), offset);
            if (r.status == protocol::DecodeStatus::NeedMoreData) break;
            if (r.status == protocol::DecodeStatus::InvalidFrame) {
                invalid = true;
                break;
            }
            offset += r.consumed;
            messages.push_back(std::move(r.message));
        }

        if (invalid) {
            dropped = buffer_.size() - offset;
            RLOG_WARN("assembler", "Sync lost at offset %zu: %s", offset,
                      log::hexPreview(buffer_.data() + offset, buffer_.size() - offset, 16).c_str());
            buffer_.clear();
        } else if (offset > 0) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
        }
    }

    frames_decoded_ += messages.size();
    for (const auto& msg : messages) {
        if (message_sink_) message_sink_(msg);
    }

    if (invalid) {
        resyncs_++;
        RLOG_ERROR("assembler", "Invalid frame, discarded %zu buffered bytes", dropped);
        if (error_sink_) {
            error_sink_(protocolError(ProtocolError::Kind::InvalidFrame,
                                      "sync marker mismatch"));
        }
    }
}

void ReceiveAssembler::clear() {
    debounce_.cancel();
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    buffer_.clear();
}

size_t ReceiveAssembler::buffered() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return buffer_.size();
}

} // namespace recdock
