// =============================================================================
// recdock - MockTransport (test helper)
// =============================================================================
// In-memory recorder. Written frames are decoded and recorded; scripted
// replies are queued as inbound bytes that read() hands out in chunks of at
// most `max_bytes`, so frames may arrive split across reads.
// =============================================================================
#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <vector>
#include "frame_codec.hpp"
#include "recdock_protocol.hpp"
#include "transport.hpp"

namespace recdock::test {

class MockTransport : public Transport {
public:
    // Called for every written frame, outside the transport lock.
    using Responder = std::function<void(MockTransport&, const protocol::Message&)>;

    explicit MockTransport(uint16_t product_id = protocol::PID_P1) : product_id_(product_id) {}

    Result<void, ProtocolError> open(uint16_t vendor_id, uint16_t) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_open_) return protocolError(ProtocolError::Kind::Transport, "no device found");
        vendor_id_ = vendor_id;
        open_ = true;
        lost_notified_ = false;
        return {};
    }

    Result<void, ProtocolError> claim_interface(int, int, int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return protocolError(ProtocolError::Kind::NotConnected, "not open");
        claimed_ = true;
        return {};
    }

    Result<size_t, ProtocolError> write(uint8_t, const uint8_t* data, size_t len) override {
        Responder responder;
        protocol::Message msg;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return protocolError(ProtocolError::Kind::NotConnected, "not open");
            if (fail_writes_) return protocolError(ProtocolError::Kind::Transport, "write failed", -1);
            auto decoded = protocol::try_decode(data, len);
            if (decoded.status == protocol::DecodeStatus::Ok) {
                msg = decoded.message;
                written_.push_back(msg);
            }
            responder = responder_;
        }
        if (responder) responder(*this, msg);
        return len;
    }

    Result<std::vector<uint8_t>, ProtocolError> read(uint8_t, size_t max_bytes) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(5),
                     [this] { return !inbound_.empty() || !open_; });
        if (!open_) return protocolError(ProtocolError::Kind::Transport, "device gone");
        if (inbound_.empty()) return protocolError(ProtocolError::Kind::Timeout, "idle");

        size_t n = std::min(max_bytes, inbound_.size());
        std::vector<uint8_t> out(inbound_.begin(), inbound_.begin() + n);
        inbound_.erase(inbound_.begin(), inbound_.begin() + n);
        return out;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        closes_++;
        cv_.notify_all();
    }

    // The hook runs after the state is sampled, so it sees the same answer
    // the caller is about to get.
    bool is_open() const override {
        bool open;
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open = open_;
            hook = is_open_hook_;
        }
        if (hook) hook();
        return open;
    }

    uint16_t vendor_id() const override { return vendor_id_; }
    uint16_t product_id() const override { return product_id_; }

    void set_disconnect_callback(DisconnectCallback cb) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_cb_ = std::move(cb);
    }

    // ---- scripting ----

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    // Answers every `command` with `body`, echoing the request sequence.
    void auto_reply(protocol::Command command, std::vector<uint8_t> body) {
        std::lock_guard<std::mutex> lock(mutex_);
        canned_[protocol::to_wire(command)] = std::move(body);
        if (!responder_) {
            responder_ = [](MockTransport& t, const protocol::Message& m) { t.answer_canned(m); };
        }
    }

    void answer_canned(const protocol::Message& request) {
        std::vector<uint8_t> body;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = canned_.find(request.id);
            if (it == canned_.end()) return;
            body = it->second;
        }
        push_frame(request.id, request.sequence, body);
    }

    void push_frame(uint16_t id, uint32_t sequence, const std::vector<uint8_t>& body) {
        auto frame = protocol::encode_frame(id, sequence, body.data(), body.size());
        push_bytes(frame.value());
    }

    void push_frame(protocol::Command command, uint32_t sequence,
                    const std::vector<uint8_t>& body) {
        push_frame(protocol::to_wire(command), sequence, body);
    }

    void push_bytes(const std::vector<uint8_t>& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.insert(inbound_.end(), bytes.begin(), bytes.end());
        cv_.notify_all();
    }

    // Device unplugged: marks closed and fires the disconnect notification once.
    void unplug() {
        DisconnectCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            if (!lost_notified_) {
                lost_notified_ = true;
                cb = disconnect_cb_;
            }
            cv_.notify_all();
        }
        if (cb) cb();
    }

    // Marks closed without notifying (only the health poll can notice).
    void vanish() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        cv_.notify_all();
    }

    void set_is_open_hook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        is_open_hook_ = std::move(hook);
    }

    void set_fail_open(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_open_ = fail;
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    std::vector<protocol::Message> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    size_t written_count(protocol::Command command) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& m : written_) {
            if (m.id == protocol::to_wire(command)) n++;
        }
        return n;
    }

    bool claimed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return claimed_;
    }

    int closes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closes_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint16_t vendor_id_ = protocol::VENDOR_ID;
    const uint16_t product_id_;
    bool open_ = false;
    bool claimed_ = false;
    bool fail_open_ = false;
    bool fail_writes_ = false;
    bool lost_notified_ = false;
    int closes_ = 0;
    std::deque<uint8_t> inbound_;
    std::vector<protocol::Message> written_;
    std::map<uint16_t, std::vector<uint8_t>> canned_;
    Responder responder_;
    DisconnectCallback disconnect_cb_;
    std::function<void()> is_open_hook_;
};

} // namespace recdock::test
