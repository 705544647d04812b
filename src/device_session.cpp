#include "device_session.hpp"
#include <limits>
#include <system_error>
#include "recdock_log.hpp"
#include "request_builders.hpp"

namespace recdock {

using protocol::Command;
using protocol::cmd_name;
using Kind = ProtocolError::Kind;

namespace {

std::unique_ptr<TaskScheduler> default_scheduler(std::unique_ptr<TaskScheduler> given) {
    if (given) return given;
    return std::make_unique<ThreadScheduler>();
}

std::future<Reply> ready_reply(Reply reply) {
    std::promise<Reply> promise;
    promise.set_value(std::move(reply));
    return promise.get_future();
}

// Waits for the reply and unwraps the alternative the command decodes to.
template<typename T>
Result<T, ProtocolError> await_reply(std::future<Reply> future, Command command) {
    Reply reply = future.get();
    if (reply.is_err()) return reply.error();
    if (auto* value = std::get_if<T>(&reply.value())) return std::move(*value);
    return protocolError(Kind::MalformedResponse,
                         std::string("unexpected reply type for ") + cmd_name(command));
}

} // anonymous namespace

DeviceSession::DeviceSession(std::unique_ptr<Transport> transport, SessionOptions options,
                             std::unique_ptr<TaskScheduler> scheduler)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      scheduler_(default_scheduler(std::move(scheduler))),
      assembler_(*scheduler_, options_.flush_threshold_bytes, options_.max_buffer_bytes),
      queue_(*scheduler_,
             [this](const std::vector<uint8_t>& frame) {
                 return transport_->write(options_.endpoint_out, frame.data(), frame.size());
             },
             [this](const PendingOperation& op, const protocol::Message& msg) {
                 return registry_.handle(op.command, msg);
             }) {
    assembler_.set_message_sink([this](const protocol::Message& msg) { on_message(msg); });
    assembler_.set_error_sink([this](const ProtocolError& err) { on_stream_error(err); });
}

DeviceSession::~DeviceSession() {
    disconnect();
    scheduler_->stop();
}

// =============================================================================
// Connection lifecycle
// =============================================================================

Result<DeviceIdentity, ProtocolError> DeviceSession::connect() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (connected_.load()) return identity();

        // a loss leaves the previous receive thread finished but joinable
        join_receive_thread();

        auto opened = transport_->open(options_.vendor_id, options_.product_id);
        if (opened.is_err()) {
            RLOG_ERROR("session", "Open failed: %s", opened.error().message.c_str());
            return opened.error();
        }
        auto claimed = transport_->claim_interface(options_.configuration,
                                                   options_.interface_number,
                                                   options_.alt_setting);
        if (claimed.is_err()) {
            RLOG_ERROR("session", "Claim interface %d failed: %s", options_.interface_number,
                       claimed.error().message.c_str());
            transport_->close();
            return claimed.error();
        }

        {
            std::lock_guard<std::mutex> id_lock(identity_mutex_);
            identity_ = DeviceIdentity{};
            identity_.vendor_id = transport_->vendor_id();
            identity_.product_id = transport_->product_id();
            identity_.model = model_from_product_id(identity_.product_id);
        }

        queue_.reset_sequence();
        assembler_.clear();
        registry_.reset_file_list();
        bytes_received_.store(0);

        transport_->set_disconnect_callback([this] { handle_lost("transport reported device loss"); });

        connected_.store(true);
        running_.store(true);
        receive_thread_ = std::thread(&DeviceSession::receive_loop, this);
        start_health_poll();

        RLOG_INFO("session", "Connected %04x:%04x (%s)", transport_->vendor_id(),
                  transport_->product_id(),
                  model_name(model_from_product_id(transport_->product_id())));
    }

    auto info = get_device_info();
    if (info.is_err()) {
        RLOG_WARN("session", "GetDeviceInfo failed (%s): firmware version unknown",
                  info.error().message.c_str());
    } else {
        RLOG_INFO("session", "Firmware %s (%u), serial %s", info.value().version_code.c_str(),
                  info.value().version_number, info.value().serial_number.c_str());
    }
    if (!connected_.load()) {
        return protocolError(Kind::Transport, "device lost during connect");
    }
    return identity();
}

void DeviceSession::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    bool was_connected = connected_.exchange(false);
    running_.store(false);

    stop_health_poll();

    queue_.cancel_all(protocolError(Kind::Cancelled, "session closed"));
    registry_.fail_transfer("session closed");

    join_receive_thread();
    assembler_.clear();
    registry_.reset_file_list();

    transport_->close();
    if (was_connected) RLOG_INFO("session", "Disconnected");
}

void DeviceSession::handle_lost(const std::string& reason) {
    if (!connected_.exchange(false)) return;
    running_.store(false);

    stop_health_poll();

    RLOG_WARN("session", "Device lost: %s", reason.c_str());

    auto error = protocolError(Kind::Transport, "device disconnected");
    registry_.fail_transfer("device disconnected");
    queue_.cancel_all(error);
    assembler_.clear();
    registry_.reset_file_list();

    DisconnectCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = disconnect_callback_;
    }
    if (cb) cb();
}

void DeviceSession::join_receive_thread() {
    if (!receive_thread_.joinable()) return;
    if (receive_thread_.get_id() == std::this_thread::get_id()) {
        // called from a callback running on the receive thread itself
        receive_thread_.detach();
        return;
    }
    try {
        receive_thread_.join();
    } catch (const std::system_error& e) {
        RLOG_ERROR("session", "Receive thread join failed: %s", e.what());
    }
}

DeviceIdentity DeviceSession::identity() const {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    return identity_;
}

void DeviceSession::set_disconnect_callback(DisconnectCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    disconnect_callback_ = std::move(cb);
}

void DeviceSession::set_receive_callback(ReceiveCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    receive_callback_ = std::move(cb);
}

// =============================================================================
// Receive path
// =============================================================================

void DeviceSession::receive_loop() {
    RLOG_DEBUG("session", "Receive loop started");
    while (running_.load()) {
        auto chunk = transport_->read(options_.endpoint_in, options_.read_chunk_size);
        if (chunk.is_err()) {
            const auto& err = chunk.error();
            if (err.kind == Kind::Timeout) continue;
            if (!transport_->is_open()) {
                handle_lost("read failed: " + err.message);
                break;
            }
            RLOG_WARN("session", "Read error: %s", err.message.c_str());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        const auto& data = chunk.value();
        if (data.empty()) continue;

        uint64_t total = bytes_received_.fetch_add(data.size()) + data.size();
        ReceiveCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = receive_callback_;
        }
        if (cb) cb(total);

        assembler_.feed(data.data(), data.size(), current_quiet_interval());
    }
    RLOG_DEBUG("session", "Receive loop stopped");
}

std::chrono::milliseconds DeviceSession::current_quiet_interval() const {
    auto in_flight = queue_.in_flight_command();
    if (in_flight && protocol::is_streaming(*in_flight)) return options_.transfer_quiet_interval;
    return options_.quiet_interval;
}

void DeviceSession::on_message(const protocol::Message& msg) {
    Command command = Command::Invalid;
    bool known = protocol::command_from_wire(msg.id, command);
    if (!protocol::is_streaming(command) && log::logLevel() <= log::Level::Debug) {
        RLOG_DEBUG("session", "Recv %s seq=%u len=%zu [%s]",
                   known ? cmd_name(command) : "unknown", msg.sequence, msg.body.size(),
                   log::hexPreview(msg.body.data(), msg.body.size()).c_str());
    }
    queue_.on_message(msg);
}

void DeviceSession::on_stream_error(const ProtocolError& error) {
    RLOG_ERROR("session", "Receive stream error: %s", error.message.c_str());
    queue_.fail_in_flight(error);
}

void DeviceSession::start_health_poll() {
    std::lock_guard<std::mutex> lock(health_mutex_);
    arm_health_poll(health_generation_);
}

void DeviceSession::stop_health_poll() {
    std::lock_guard<std::mutex> lock(health_mutex_);
    ++health_generation_;
    if (health_task_ != INVALID_TASK) scheduler_->cancel(health_task_);
    health_task_ = INVALID_TASK;
}

// Caller holds health_mutex_.
void DeviceSession::arm_health_poll(uint64_t generation) {
    health_task_ = scheduler_->schedule_after(options_.health_poll_interval,
                                              [this, generation] { poll_health(generation); });
}

void DeviceSession::poll_health(uint64_t generation) {
    if (!running_.load()) return;
    if (!transport_->is_open()) {
        handle_lost("transport closed");
        return;
    }
    std::lock_guard<std::mutex> lock(health_mutex_);
    // polling was stopped (and maybe restarted) while this poll ran
    if (generation != health_generation_) return;
    arm_health_poll(generation);
}

// =============================================================================
// Dispatch helpers
// =============================================================================

std::future<Reply> DeviceSession::send(Command command, std::vector<uint8_t> body,
                                       std::optional<std::chrono::milliseconds> timeout) {
    CommandQueue::SendOptions options;
    options.timeout = timeout;
    return submit(command, std::move(body), std::move(options));
}

std::future<Reply> DeviceSession::submit(Command command, std::vector<uint8_t> body,
                                         CommandQueue::SendOptions options) {
    if (!connected_.load()) {
        Reply reply(protocolError(Kind::NotConnected, "device not connected"));
        if (options.on_finished) options.on_finished(reply, false);
        return ready_reply(std::move(reply));
    }
    return queue_.send(command, std::move(body), std::move(options));
}

std::optional<ProtocolError> DeviceSession::check_gate(Capability capability) const {
    if (!connected_.load()) return protocolError(Kind::NotConnected, "device not connected");
    DeviceIdentity id = identity();
    if (is_supported(capability, id.model, id.version_number)) return std::nullopt;
    RLOG_INFO("session", "%s not supported by %s firmware %u", capability_name(capability),
              model_name(id.model), id.version_number.value_or(0));
    return protocolError(Kind::Unsupported, std::string(capability_name(capability)) +
                                                " not supported on " + model_name(id.model));
}

Result<StatusReply, ProtocolError> DeviceSession::simple_command(Command command,
                                                                 std::vector<uint8_t> body,
                                                                 std::chrono::milliseconds timeout) {
    return await_reply<StatusReply>(send(command, std::move(body), timeout), command);
}

// =============================================================================
// Device
// =============================================================================

Result<DeviceInfo, ProtocolError> DeviceSession::get_device_info() {
    auto info = await_reply<DeviceInfo>(
        send(Command::GetDeviceInfo, {}, options_.timeouts.device_info), Command::GetDeviceInfo);
    if (info.is_ok()) {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        identity_.version_number = info.value().version_number;
        identity_.version_code = info.value().version_code;
        identity_.serial_number = info.value().serial_number;
    }
    return info;
}

Result<DeviceTime, ProtocolError> DeviceSession::get_device_time() {
    return await_reply<DeviceTime>(
        send(Command::GetDeviceTime, {}, options_.timeouts.command), Command::GetDeviceTime);
}

Result<StatusReply, ProtocolError> DeviceSession::set_device_time(const DateTime& time) {
    auto body = protocol::build_set_time(time);
    if (body.is_err()) return body.error();
    return simple_command(Command::SetDeviceTime, std::move(body).value(),
                          options_.timeouts.command);
}

// =============================================================================
// Recordings
// =============================================================================

Result<uint32_t, ProtocolError> DeviceSession::get_file_count() {
    return await_reply<uint32_t>(
        send(Command::GetFileCount, {}, options_.timeouts.file_count), Command::GetFileCount);
}

Result<RecordingList, ProtocolError> DeviceSession::list_files() {
    std::optional<uint32_t> known;
    if (needs_file_count_prequery(identity().version_number)) {
        auto count = get_file_count();
        if (count.is_err()) return count.error();
        if (count.value() == 0) return RecordingList{};
        known = count.value();
    }

    CommandQueue::SendOptions options;
    options.timeout = options_.timeouts.file_list;
    options.on_dispatch = [this, known] { registry_.begin_file_list(known); };
    options.on_finished = [this](const Reply& reply, bool dispatched) {
        if (reply.is_err() && dispatched) registry_.reset_file_list();
    };
    auto list = await_reply<RecordingList>(submit(Command::GetFileList, {}, std::move(options)),
                                           Command::GetFileList);
    if (list.is_ok()) RLOG_INFO("session", "Listed %zu recording(s)", list.value().size());
    return list;
}

Result<StatusReply, ProtocolError> DeviceSession::delete_file(const std::string& filename) {
    if (filename.empty()) return protocolError(Kind::InvalidArgument, "empty filename");
    return simple_command(Command::DeleteFile, protocol::build_filename(filename),
                          options_.timeouts.delete_file);
}

Result<TransferSummary, ProtocolError> DeviceSession::run_transfer(
    Command command, std::vector<uint8_t> body, const std::string& filename, int64_t length,
    ProgressCallback on_progress, ChunkCallback on_chunk) {
    if (length <= 0) {
        return protocolError(Kind::InvalidArgument, "transfer length must be positive");
    }
    if (length > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return protocolError(Kind::InvalidArgument, "transfer length exceeds 32 bits");
    }
    if (!connected_.load()) return protocolError(Kind::NotConnected, "device not connected");

    auto transfer = std::make_shared<StreamingTransfer>(command, filename,
                                                        static_cast<uint32_t>(length),
                                                        std::move(on_progress),
                                                        std::move(on_chunk));
    if (!registry_.install_transfer(transfer)) {
        return protocolError(Kind::InvalidArgument, "another transfer is already active");
    }

    RLOG_INFO("session", "%s %s (%lld bytes)", cmd_name(command), filename.c_str(),
              static_cast<long long>(length));

    CommandQueue::SendOptions options;
    options.timeout = options_.timeouts.transfer;
    options.on_finished = [this, transfer](const Reply& reply, bool) {
        if (reply.is_ok()) return;
        transfer->fail(reply.error().message);
        registry_.clear_transfer(transfer);
    };
    return await_reply<TransferSummary>(submit(command, std::move(body), std::move(options)),
                                        command);
}

Result<TransferSummary, ProtocolError> DeviceSession::download_file(const std::string& filename,
                                                                    int64_t length,
                                                                    ProgressCallback on_progress,
                                                                    ChunkCallback on_chunk) {
    return run_transfer(Command::TransferFile, protocol::build_filename(filename), filename,
                        length, std::move(on_progress), std::move(on_chunk));
}

Result<TransferSummary, ProtocolError> DeviceSession::get_file_block(const std::string& filename,
                                                                     int64_t length,
                                                                     ProgressCallback on_progress,
                                                                     ChunkCallback on_chunk) {
    uint32_t len = length > 0 ? static_cast<uint32_t>(length) : 0;
    return run_transfer(Command::GetFileBlock, protocol::build_file_block(len, filename),
                        filename, length, std::move(on_progress), std::move(on_chunk));
}

Result<TransferSummary, ProtocolError> DeviceSession::read_file_range(const std::string& filename,
                                                                      uint32_t offset,
                                                                      int64_t length,
                                                                      ProgressCallback on_progress,
                                                                      ChunkCallback on_chunk) {
    uint32_t len = length > 0 ? static_cast<uint32_t>(length) : 0;
    return run_transfer(Command::ReadFile, protocol::build_read_file(offset, len, filename),
                        filename, length, std::move(on_progress), std::move(on_chunk));
}

// =============================================================================
// Settings
// =============================================================================

Result<DeviceSettings, ProtocolError> DeviceSession::get_settings() {
    if (auto gated = check_gate(Capability::GetSettings)) {
        if (gated->kind == Kind::Unsupported) return gated_settings();
        return *gated;
    }
    return await_reply<DeviceSettings>(
        send(Command::GetSettings, {}, options_.timeouts.command), Command::GetSettings);
}

Result<StatusReply, ProtocolError> DeviceSession::set_setting(Capability capability,
                                                              protocol::SettingSlot slot,
                                                              bool on) {
    if (auto gated = check_gate(capability)) return *gated;
    return simple_command(Command::SetSettings, protocol::build_set_setting(slot, on),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::set_auto_record(bool on) {
    return set_setting(Capability::SetSettings, protocol::SettingSlot::AutoRecord, on);
}

Result<StatusReply, ProtocolError> DeviceSession::set_auto_play(bool on) {
    return set_setting(Capability::SetSettings, protocol::SettingSlot::AutoPlay, on);
}

Result<StatusReply, ProtocolError> DeviceSession::set_notification(bool on) {
    return set_setting(Capability::SetSettings, protocol::SettingSlot::Notification, on);
}

Result<StatusReply, ProtocolError> DeviceSession::set_bluetooth_prompt_tone(bool on) {
    return set_setting(Capability::SetBluetoothPromptTone,
                       protocol::SettingSlot::BluetoothPromptTone, on);
}

// =============================================================================
// Storage / reset
// =============================================================================

Result<CardInfo, ProtocolError> DeviceSession::get_card_info() {
    if (auto gated = check_gate(Capability::StorageCommands)) return *gated;
    return await_reply<CardInfo>(
        send(Command::ReadCardInfo, {}, options_.timeouts.command), Command::ReadCardInfo);
}

Result<StatusReply, ProtocolError> DeviceSession::format_card() {
    if (auto gated = check_gate(Capability::StorageCommands)) return *gated;
    RLOG_WARN("session", "Formatting storage card");
    return simple_command(Command::FormatCard, protocol::build_confirm_code(),
                          options_.timeouts.format_card);
}

Result<OptionalRecordingFile, ProtocolError> DeviceSession::get_recording_file() {
    if (auto gated = check_gate(Capability::StorageCommands)) return *gated;
    return await_reply<OptionalRecordingFile>(
        send(Command::GetRecordingFile, {}, options_.timeouts.command), Command::GetRecordingFile);
}

Result<StatusReply, ProtocolError> DeviceSession::restore_factory_settings() {
    if (auto gated = check_gate(Capability::RestoreFactorySettings)) return *gated;
    return simple_command(Command::RestoreFactorySettings, protocol::build_confirm_code(),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::factory_reset() {
    if (auto gated = check_gate(Capability::FactoryReset)) return *gated;
    RLOG_WARN("session", "Factory reset requested");
    return simple_command(Command::FactoryReset, {}, options_.timeouts.command);
}

// =============================================================================
// Firmware
// =============================================================================

Result<StatusReply, ProtocolError> DeviceSession::request_firmware_upgrade(uint32_t version_number,
                                                                           uint32_t size) {
    return simple_command(Command::RequestFirmwareUpgrade,
                          protocol::build_firmware_request(version_number, size),
                          options_.timeouts.firmware);
}

Result<StatusReply, ProtocolError> DeviceSession::upload_firmware(const std::vector<uint8_t>& image,
                                                                  WriteProgressCallback on_written) {
    if (image.empty()) return protocolError(Kind::InvalidArgument, "empty firmware image");
    RLOG_INFO("session", "Uploading firmware image (%zu bytes)", image.size());

    CommandQueue::SendOptions options;
    options.timeout = options_.timeouts.firmware;
    options.on_written = std::move(on_written);
    return await_reply<StatusReply>(submit(Command::FirmwareUpload, image, std::move(options)),
                                    Command::FirmwareUpload);
}

// =============================================================================
// Factory test
// =============================================================================

Result<StatusReply, ProtocolError> DeviceSession::begin_bnc_test() {
    return simple_command(Command::BncTest, protocol::build_bnc(true), options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::end_bnc_test() {
    return simple_command(Command::BncTest, protocol::build_bnc(false), options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::record_test_start(uint8_t type) {
    return simple_command(Command::RecordTestStart, {type}, options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::record_test_end(uint8_t type) {
    return simple_command(Command::RecordTestEnd, {type}, options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::write_serial_number(const std::string& serial) {
    if (serial.empty()) return protocolError(Kind::InvalidArgument, "empty serial number");
    return simple_command(Command::TestSnWrite, protocol::build_filename(serial),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::send_schedule_info(
    const std::vector<protocol::ScheduleInfo>& schedules) {
    return simple_command(Command::SendScheduleInfo, protocol::build_schedule_info(schedules),
                          options_.timeouts.command);
}

// =============================================================================
// Bluetooth
// =============================================================================

Result<BluetoothDeviceList, ProtocolError> DeviceSession::bluetooth_scan() {
    if (auto gated = check_gate(Capability::Bluetooth)) return *gated;
    return await_reply<BluetoothDeviceList>(
        send(Command::BluetoothScan, {}, options_.timeouts.bluetooth_scan), Command::BluetoothScan);
}

Result<StatusReply, ProtocolError> DeviceSession::bluetooth_connect(const std::string& mac) {
    if (auto gated = check_gate(Capability::Bluetooth)) return *gated;
    auto body = protocol::build_bluetooth_connect(mac);
    if (body.is_err()) return body.error();
    return simple_command(Command::BluetoothCmd, std::move(body).value(),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::bluetooth_disconnect() {
    if (auto gated = check_gate(Capability::Bluetooth)) return *gated;
    return simple_command(Command::BluetoothCmd, protocol::build_bluetooth_disconnect(),
                          options_.timeouts.command);
}

Result<BluetoothStatus, ProtocolError> DeviceSession::bluetooth_status() {
    if (auto gated = check_gate(Capability::Bluetooth)) return *gated;
    return await_reply<BluetoothStatus>(
        send(Command::BluetoothStatus, {}, options_.timeouts.command), Command::BluetoothStatus);
}

// =============================================================================
// Realtime
// =============================================================================

Result<RawBody, ProtocolError> DeviceSession::get_realtime_settings() {
    return await_reply<RawBody>(send(Command::GetRealtimeSettings, {}, options_.timeouts.command),
                                Command::GetRealtimeSettings);
}

Result<StatusReply, ProtocolError> DeviceSession::start_realtime() {
    return simple_command(Command::ControlRealtime,
                          protocol::build_realtime_control(protocol::RealtimeAction::Start),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::pause_realtime() {
    return simple_command(Command::ControlRealtime,
                          protocol::build_realtime_control(protocol::RealtimeAction::Pause),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::stop_realtime() {
    return simple_command(Command::ControlRealtime,
                          protocol::build_realtime_control(protocol::RealtimeAction::Stop),
                          options_.timeouts.command);
}

Result<RealtimeData, ProtocolError> DeviceSession::get_realtime_data(uint32_t frame_index) {
    return await_reply<RealtimeData>(
        send(Command::GetRealtimeData, protocol::build_u32(frame_index), options_.timeouts.command),
        Command::GetRealtimeData);
}

// =============================================================================
// Tone / UAC images
// =============================================================================

Result<StatusReply, ProtocolError> DeviceSession::request_tone_update(
    const std::string& signature_hex, uint32_t size) {
    auto body = protocol::build_update_request(signature_hex, size);
    if (body.is_err()) return body.error();
    return simple_command(Command::RequestToneUpdate, std::move(body).value(),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::update_tone(const std::vector<uint8_t>& image) {
    if (image.empty()) return protocolError(Kind::InvalidArgument, "empty tone image");
    return simple_command(Command::UpdateTone, image, options_.timeouts.firmware);
}

Result<StatusReply, ProtocolError> DeviceSession::request_uac_update(
    const std::string& signature_hex, uint32_t size) {
    auto body = protocol::build_update_request(signature_hex, size);
    if (body.is_err()) return body.error();
    return simple_command(Command::RequestUacUpdate, std::move(body).value(),
                          options_.timeouts.command);
}

Result<StatusReply, ProtocolError> DeviceSession::update_uac(const std::vector<uint8_t>& image) {
    if (image.empty()) return protocolError(Kind::InvalidArgument, "empty UAC image");
    return simple_command(Command::UpdateUac, image, options_.timeouts.firmware);
}

} // namespace recdock
