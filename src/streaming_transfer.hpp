// =============================================================================
// recdock - Streaming Transfer
// =============================================================================
// Byte-count reassembly for TransferFile / GetFileBlock / ReadFile. Many
// frames share one command id; the transfer completes once the cumulative
// body length reaches the expected length.
//
// Progress is reported on every chunk, and exactly once more with
// failed=true when the transfer fails.
// =============================================================================
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "recdock_protocol.hpp"
#include "response_types.hpp"

namespace recdock {

struct TransferProgress {
    uint64_t received = 0;
    uint64_t expected = 0;
    bool failed = false;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;
// Receives each chunk as it arrives. When set, chunks are not buffered.
using ChunkCallback = std::function<void(const uint8_t* data, size_t len)>;

class StreamingTransfer {
public:
    enum class State { Active, Completed, Failed };

    StreamingTransfer(protocol::Command command, std::string filename, uint32_t expected,
                      ProgressCallback on_progress = {}, ChunkCallback on_chunk = {});

    protocol::Command command() const { return command_; }
    const std::string& filename() const { return filename_; }
    uint32_t expected() const { return expected_; }

    State state() const;
    uint64_t received() const;

    // Consumes one frame body. An empty body is the device's failure signal.
    State on_chunk(const std::vector<uint8_t>& body);

    // Marks the transfer failed. Returns false if it had already finished.
    bool fail(const std::string& reason);

    // Moves the buffered data out; call once after completion.
    TransferSummary take_summary();

    std::string failure_reason() const;

private:
    void report(const TransferProgress& p);

    const protocol::Command command_;
    const std::string filename_;
    const uint32_t expected_;
    ProgressCallback on_progress_;
    ChunkCallback on_chunk_;
    std::chrono::steady_clock::time_point started_;

    mutable std::mutex mutex_;
    State state_ = State::Active;
    uint64_t received_ = 0;
    std::vector<uint8_t> data_;
    std::string failure_;
};

} // namespace recdock
