// =============================================================================
// recdock - Device Session
// =============================================================================
// One connection to a recorder. Owns the transport, the per-session timers,
// the receive assembler, the single-flight command queue and the reply
// handlers; nothing protocol-related is process-wide.
//
// Threads:
//   caller threads  - typed operations block on their reply
//   receive thread  - transport reads feeding the assembler
//   scheduler       - decode debounce, operation timeouts, health polling
//
// Every operation returns Result<T, ProtocolError>. Capability-gated
// operations are resolved locally without a round trip.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "capability_gate.hpp"
#include "command_queue.hpp"
#include "device_identity.hpp"
#include "handler_registry.hpp"
#include "meeting_shortcuts.hpp"
#include "receive_assembler.hpp"
#include "recdock_protocol.hpp"
#include "request_builders.hpp"
#include "result.hpp"
#include "streaming_transfer.hpp"
#include "task_scheduler.hpp"
#include "transport.hpp"

namespace recdock {

// Per-command reply windows. Transfers have no timeout unless one is set.
struct TimeoutSettings {
    std::chrono::milliseconds device_info{5000};
    std::chrono::milliseconds file_count{5000};
    std::chrono::milliseconds file_list{20000};
    std::chrono::milliseconds command{5000};
    std::chrono::milliseconds delete_file{10000};
    std::chrono::milliseconds format_card{60000};
    std::chrono::milliseconds bluetooth_scan{20000};
    std::chrono::milliseconds firmware{30000};
    std::optional<std::chrono::milliseconds> transfer;
};

struct SessionOptions {
    uint16_t vendor_id = protocol::VENDOR_ID;
    uint16_t product_id = 0;  // 0 = any known model
    uint8_t endpoint_out = protocol::EP_OUT;
    uint8_t endpoint_in = protocol::EP_IN;
    int configuration = protocol::USB_CONFIGURATION;
    int interface_number = protocol::USB_INTERFACE;
    int alt_setting = protocol::USB_ALT_SETTING;
    size_t read_chunk_size = 51200;

    std::chrono::milliseconds quiet_interval{10};
    std::chrono::milliseconds transfer_quiet_interval{1000};
    size_t flush_threshold_bytes = 512 * 1024;
    size_t max_buffer_bytes = 16 * 1024 * 1024;
    std::chrono::milliseconds health_poll_interval{100};

    TimeoutSettings timeouts;
};

class DeviceSession {
public:
    using DisconnectCallback = std::function<void()>;
    using ReceiveCallback = std::function<void(uint64_t total_bytes)>;
    using WriteProgressCallback = std::function<void(size_t bytes_written)>;

    // `scheduler` defaults to a private ThreadScheduler.
    explicit DeviceSession(std::unique_ptr<Transport> transport,
                           SessionOptions options = SessionOptions(),
                           std::unique_ptr<TaskScheduler> scheduler = nullptr);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Opens and claims the device, then queries GetDeviceInfo. A failed
    // device-info query leaves the session connected with an unknown version.
    Result<DeviceIdentity, ProtocolError> connect();

    // Cancels everything outstanding and releases the device. Does not invoke
    // the disconnect callback.
    void disconnect();

    bool is_connected() const { return connected_.load(); }
    DeviceIdentity identity() const;
    const SessionOptions& options() const { return options_; }

    // Invoked exactly once when the device is lost while connected.
    void set_disconnect_callback(DisconnectCallback cb);
    // Invoked from the receive thread with the cumulative byte count.
    void set_receive_callback(ReceiveCallback cb);

    // Raw access: queues `command` and resolves with the decoded reply.
    std::future<Reply> send(protocol::Command command, std::vector<uint8_t> body = {},
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ---- device ----
    Result<DeviceInfo, ProtocolError> get_device_info();
    Result<DeviceTime, ProtocolError> get_device_time();
    Result<StatusReply, ProtocolError> set_device_time(const DateTime& time);

    // ---- recordings ----
    Result<uint32_t, ProtocolError> get_file_count();
    Result<RecordingList, ProtocolError> list_files();
    Result<StatusReply, ProtocolError> delete_file(const std::string& filename);

    Result<TransferSummary, ProtocolError> download_file(const std::string& filename,
                                                         int64_t length,
                                                         ProgressCallback on_progress = {},
                                                         ChunkCallback on_chunk = {});
    Result<TransferSummary, ProtocolError> get_file_block(const std::string& filename,
                                                          int64_t length,
                                                          ProgressCallback on_progress = {},
                                                          ChunkCallback on_chunk = {});
    Result<TransferSummary, ProtocolError> read_file_range(const std::string& filename,
                                                           uint32_t offset, int64_t length,
                                                           ProgressCallback on_progress = {},
                                                           ChunkCallback on_chunk = {});

    // ---- settings ----
    Result<DeviceSettings, ProtocolError> get_settings();
    Result<StatusReply, ProtocolError> set_auto_record(bool on);
    Result<StatusReply, ProtocolError> set_auto_play(bool on);
    Result<StatusReply, ProtocolError> set_notification(bool on);
    Result<StatusReply, ProtocolError> set_bluetooth_prompt_tone(bool on);

    // ---- storage / reset ----
    Result<CardInfo, ProtocolError> get_card_info();
    Result<StatusReply, ProtocolError> format_card();
    Result<OptionalRecordingFile, ProtocolError> get_recording_file();
    Result<StatusReply, ProtocolError> restore_factory_settings();
    Result<StatusReply, ProtocolError> factory_reset();

    // ---- firmware ----
    Result<StatusReply, ProtocolError> request_firmware_upgrade(uint32_t version_number,
                                                                uint32_t size);
    Result<StatusReply, ProtocolError> upload_firmware(const std::vector<uint8_t>& image,
                                                       WriteProgressCallback on_written = {});

    // ---- factory test ----
    Result<StatusReply, ProtocolError> begin_bnc_test();
    Result<StatusReply, ProtocolError> end_bnc_test();
    Result<StatusReply, ProtocolError> record_test_start(uint8_t type);
    Result<StatusReply, ProtocolError> record_test_end(uint8_t type);
    Result<StatusReply, ProtocolError> write_serial_number(const std::string& serial);

    Result<StatusReply, ProtocolError> send_schedule_info(
        const std::vector<protocol::ScheduleInfo>& schedules);

    // ---- bluetooth (P1 only) ----
    Result<BluetoothDeviceList, ProtocolError> bluetooth_scan();
    Result<StatusReply, ProtocolError> bluetooth_connect(const std::string& mac);
    Result<StatusReply, ProtocolError> bluetooth_disconnect();
    Result<BluetoothStatus, ProtocolError> bluetooth_status();

    // ---- realtime audio ----
    Result<RawBody, ProtocolError> get_realtime_settings();
    Result<StatusReply, ProtocolError> start_realtime();
    Result<StatusReply, ProtocolError> pause_realtime();
    Result<StatusReply, ProtocolError> stop_realtime();
    Result<RealtimeData, ProtocolError> get_realtime_data(uint32_t frame_index);

    // ---- tone / UAC images ----
    Result<StatusReply, ProtocolError> request_tone_update(const std::string& signature_hex,
                                                           uint32_t size);
    Result<StatusReply, ProtocolError> update_tone(const std::vector<uint8_t>& image);
    Result<StatusReply, ProtocolError> request_uac_update(const std::string& signature_hex,
                                                          uint32_t size);
    Result<StatusReply, ProtocolError> update_uac(const std::vector<uint8_t>& image);

    // Stats
    uint64_t bytes_received() const { return bytes_received_.load(); }
    const ReceiveAssembler& assembler() const { return assembler_; }
    const CommandQueue& queue() const { return queue_; }

private:
    std::future<Reply> submit(protocol::Command command, std::vector<uint8_t> body,
                              CommandQueue::SendOptions options);
    std::optional<ProtocolError> check_gate(Capability capability) const;

    Result<StatusReply, ProtocolError> simple_command(protocol::Command command,
                                                      std::vector<uint8_t> body,
                                                      std::chrono::milliseconds timeout);
    Result<StatusReply, ProtocolError> set_setting(Capability capability,
                                                   protocol::SettingSlot slot, bool on);
    Result<TransferSummary, ProtocolError> run_transfer(protocol::Command command,
                                                        std::vector<uint8_t> body,
                                                        const std::string& filename,
                                                        int64_t length,
                                                        ProgressCallback on_progress,
                                                        ChunkCallback on_chunk);

    void receive_loop();
    void on_message(const protocol::Message& msg);
    void on_stream_error(const ProtocolError& error);
    std::chrono::milliseconds current_quiet_interval() const;

    void start_health_poll();
    void stop_health_poll();
    void arm_health_poll(uint64_t generation);
    void poll_health(uint64_t generation);
    // Device loss: fails everything and notifies once.
    void handle_lost(const std::string& reason);
    void join_receive_thread();

    const SessionOptions options_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<TaskScheduler> scheduler_;  // outlives the members below

    HandlerRegistry registry_;
    ReceiveAssembler assembler_;
    CommandQueue queue_;

    mutable std::mutex identity_mutex_;
    DeviceIdentity identity_;

    std::mutex callback_mutex_;
    DisconnectCallback disconnect_callback_;
    ReceiveCallback receive_callback_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> bytes_received_{0};

    std::mutex health_mutex_;
    TaskId health_task_ = INVALID_TASK;
    uint64_t health_generation_ = 0;  // bumped whenever polling stops

    std::mutex lifecycle_mutex_;  // connect / disconnect
    std::thread receive_thread_;
};

} // namespace recdock
