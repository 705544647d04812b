#include "streaming_transfer.hpp"
#include "recdock_log.hpp"

namespace recdock {

StreamingTransfer::StreamingTransfer(protocol::Command command, std::string filename,
                                     uint32_t expected, ProgressCallback on_progress,
                                     ChunkCallback on_chunk)
    : command_(command),
      filename_(std::move(filename)),
      expected_(expected),
      on_progress_(std::move(on_progress)),
      on_chunk_(std::move(on_chunk)),
      started_(std::chrono::steady_clock::now()) {
    RLOG_INFO("transfer", "%s start: %s, %u bytes",
              protocol::cmd_name(command_), filename_.c_str(), expected_);
}

StreamingTransfer::State StreamingTransfer::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t StreamingTransfer::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
}

StreamingTransfer::State StreamingTransfer::on_chunk(const std::vector<uint8_t>& body) {
    if (body.empty()) {
        fail("device reported failure");
        return State::Failed;
    }

    TransferProgress p;
    State state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Active) return state_;
        received_ += body.size();
        if (!on_chunk_) data_.insert(data_.end(), body.begin(), body.end());
        if (received_ >= expected_) state_ = State::Completed;
        p.received = received_;
        p.expected = expected_;
        state = state_;
    }

    if (on_chunk_) on_chunk_(body.data(), body.size());
    report(p);

    if (state == State::Completed) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_).count();
        RLOG_INFO("transfer", "%s finished: %s, %llu bytes in %lld ms",
                  protocol::cmd_name(command_), filename_.c_str(),
                  (unsigned long long)p.received, (long long)ms);
    } else {
        RLOG_TRACE("transfer", "%s %llu/%u", filename_.c_str(),
                   (unsigned long long)p.received, expected_);
    }
    return state;
}

bool StreamingTransfer::fail(const std::string& reason) {
    TransferProgress p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Active) return false;
        state_ = State::Failed;
        failure_ = reason;
        p.received = received_;
        p.expected = expected_;
        p.failed = true;
    }
    RLOG_WARN("transfer", "%s failed: %s (%llu/%u bytes): %s",
              protocol::cmd_name(command_), filename_.c_str(),
              (unsigned long long)p.received, expected_, reason.c_str());
    report(p);
    return true;
}

TransferSummary StreamingTransfer::take_summary() {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferSummary s;
    s.filename = filename_;
    s.expected = expected_;
    s.received = received_;
    s.elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_).count());
    s.data = std::move(data_);
    data_.clear();
    return s;
}

std::string StreamingTransfer::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

void StreamingTransfer::report(const TransferProgress& p) {
    if (on_progress_) on_progress_(p);
}

} // namespace recdock
