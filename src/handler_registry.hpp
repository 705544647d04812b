// =============================================================================
// recdock - Handler Registry
// =============================================================================
// Maps a correlated reply to its decoder. Holds the state for multi-frame
// replies: the file-list accumulator and the single active streaming transfer.
//
// handle() returns nullopt while a multi-frame reply is still incomplete.
// =============================================================================
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include "command_queue.hpp"
#include "file_list_parser.hpp"
#include "frame_codec.hpp"
#include "streaming_transfer.hpp"

namespace recdock {

template<typename T>
Reply to_reply(Result<T, ProtocolError> r) {
    if (r.is_err()) return Reply(r.error());
    return Reply(ResponseValue(std::move(r).value()));
}

class HandlerRegistry {
public:
    std::optional<Reply> handle(protocol::Command command, const protocol::Message& msg);

    // File list: `known_count` is the GetFileCount result when it was queried.
    void begin_file_list(std::optional<uint32_t> known_count);
    void reset_file_list();
    bool file_list_active() const;

    // Only one streaming transfer may be installed. Returns false if busy.
    bool install_transfer(std::shared_ptr<StreamingTransfer> transfer);
    std::shared_ptr<StreamingTransfer> active_transfer() const;
    // Removes `transfer` if it is the installed one.
    void clear_transfer(const std::shared_ptr<StreamingTransfer>& transfer);
    // Fails and removes the installed transfer, if any.
    void fail_transfer(const std::string& reason);

private:
    std::optional<Reply> handle_stream_chunk(protocol::Command command,
                                             const protocol::Message& msg);

    mutable std::mutex mutex_;
    protocol::FileListAccumulator file_list_;
    std::shared_ptr<StreamingTransfer> transfer_;
};

} // namespace recdock
