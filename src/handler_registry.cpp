#include "handler_registry.hpp"
#include "recdock_log.hpp"
#include "response_decoders.hpp"

namespace recdock {

using protocol::Command;

namespace {

Reply status_reply(const StatusReply& s) {
    return Reply(ResponseValue(s));
}

} // anonymous namespace

std::optional<Reply> HandlerRegistry::handle(Command command, const protocol::Message& msg) {
    const auto& body = msg.body;

    switch (command) {
        case Command::GetDeviceInfo:
            return to_reply(protocol::decode_device_info(body));
        case Command::GetDeviceTime:
            return to_reply(protocol::decode_device_time(body));
        case Command::GetFileCount:
            return to_reply(protocol::decode_file_count(body));
        case Command::GetSettings:
            return to_reply(protocol::decode_settings(body));
        case Command::ReadCardInfo:
            return to_reply(protocol::decode_card_info(body));
        case Command::GetRecordingFile:
            return to_reply(protocol::decode_recording_file(body));
        case Command::BluetoothScan:
            return to_reply(protocol::decode_bluetooth_scan(body));
        case Command::BluetoothStatus:
            return to_reply(protocol::decode_bluetooth_status(body));
        case Command::GetRealtimeData:
            return to_reply(protocol::decode_realtime_data(body));
        case Command::GetRealtimeSettings:
            return Reply(ResponseValue(RawBody(body)));

        case Command::GetFileList: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto list = file_list_.feed(body);
            if (!list) return std::nullopt;
            return Reply(ResponseValue(std::move(*list)));
        }

        case Command::TransferFile:
        case Command::GetFileBlock:
        case Command::ReadFile:
            return handle_stream_chunk(command, msg);

        case Command::DeleteFile:
            return status_reply(protocol::decode_delete_status(body));
        case Command::RequestFirmwareUpgrade:
            return status_reply(protocol::decode_firmware_request_status(body));
        case Command::RequestToneUpdate:
        case Command::RequestUacUpdate:
            return status_reply(protocol::decode_update_request_status(body));

        case Command::SetDeviceTime:
        case Command::FirmwareUpload:
        case Command::BncTest:
        case Command::SetSettings:
        case Command::FormatCard:
        case Command::RestoreFactorySettings:
        case Command::SendScheduleInfo:
        case Command::UpdateTone:
        case Command::UpdateUac:
        case Command::ControlRealtime:
        case Command::BluetoothCmd:
        case Command::TestSnWrite:
        case Command::RecordTestStart:
        case Command::RecordTestEnd:
        case Command::FactoryReset:
            return status_reply(protocol::decode_generic_status(body));

        case Command::Invalid:
            break;
    }
    return Reply(protocolError(ProtocolError::Kind::MalformedResponse,
                               "reply to invalid command id"));
}

std::optional<Reply> HandlerRegistry::handle_stream_chunk(Command command,
                                                          const protocol::Message& msg) {
    std::shared_ptr<StreamingTransfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transfer_ && transfer_->command() == command) transfer = transfer_;
    }

    if (!transfer) {
        // a block request that was not issued as a transfer is a plain acknowledgement
        if (command == Command::GetFileBlock) {
            return status_reply(protocol::decode_generic_status(msg.body));
        }
        RLOG_WARN("handler", "%s data with no active transfer (%zu bytes)",
                  protocol::cmd_name(command), msg.body.size());
        return Reply(protocolError(ProtocolError::Kind::MalformedResponse,
                                   "stream data with no active transfer"));
    }

    switch (transfer->on_chunk(msg.body)) {
        case StreamingTransfer::State::Active:
            return std::nullopt;
        case StreamingTransfer::State::Completed:
            clear_transfer(transfer);
            return Reply(ResponseValue(transfer->take_summary()));
        case StreamingTransfer::State::Failed:
            break;
    }
    clear_transfer(transfer);
    return Reply(protocolError(ProtocolError::Kind::Transport,
                               "transfer failed: " + transfer->failure_reason()));
}

void HandlerRegistry::begin_file_list(std::optional<uint32_t> known_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_list_.begin(known_count);
}

void HandlerRegistry::reset_file_list() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_list_.reset();
}

bool HandlerRegistry::file_list_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_list_.active();
}

bool HandlerRegistry::install_transfer(std::shared_ptr<StreamingTransfer> transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transfer_) return false;
    transfer_ = std::move(transfer);
    return true;
}

std::shared_ptr<StreamingTransfer> HandlerRegistry::active_transfer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_;
}

void HandlerRegistry::clear_transfer(const std::shared_ptr<StreamingTransfer>& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transfer_ == transfer) transfer_.reset();
}

void HandlerRegistry::fail_transfer(const std::string& reason) {
    std::shared_ptr<StreamingTransfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer = std::move(transfer_);
        transfer_.reset();
    }
    if (transfer) transfer->fail(reason);
}

} // namespace recdock
