#include "usb_transport.hpp"
#include "device_identity.hpp"
#include "recdock_log.hpp"

namespace recdock {

LibusbTransport::LibusbTransport(unsigned int read_timeout_ms, unsigned int write_timeout_ms)
    : read_timeout_ms_(read_timeout_ms), write_timeout_ms_(write_timeout_ms) {}

LibusbTransport::~LibusbTransport() {
    close();
}

ProtocolError LibusbTransport::usb_error(const char* what, int rc) {
    return protocolError(ProtocolError::Kind::Transport,
                         std::string(what) + ": " + libusb_error_name(rc), rc);
}

void LibusbTransport::set_disconnect_callback(DisconnectCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    disconnect_cb_ = std::move(cb);
}

Result<void, ProtocolError> LibusbTransport::open(uint16_t vendor_id, uint16_t product_id) {
    if (open_.load()) return Result<void, ProtocolError>();
    // handle left behind by a fatal error
    if (handle_ || ctx_) close();

    int rc = libusb_init(&ctx_);
    if (rc != LIBUSB_SUCCESS) {
        RLOG_ERROR("usb", "Failed to init libusb: %s", libusb_error_name(rc));
        ctx_ = nullptr;
        return usb_error("libusb_init", rc);
    }

    libusb_device** devs = nullptr;
    ssize_t cnt = libusb_get_device_list(ctx_, &devs);
    if (cnt < 0) {
        int err = static_cast<int>(cnt);
        libusb_exit(ctx_);
        ctx_ = nullptr;
        return usb_error("libusb_get_device_list", err);
    }

    int open_rc = LIBUSB_ERROR_NOT_FOUND;
    for (ssize_t i = 0; i < cnt && !handle_; i++) {
        struct libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[i], &desc) != LIBUSB_SUCCESS) continue;
        if (desc.idVendor != vendor_id) continue;

        bool wanted = product_id != 0 ? desc.idProduct == product_id
                                      : is_known_product(desc.idProduct);
        if (!wanted) continue;

        open_rc = libusb_open(devs[i], &handle_);
        if (open_rc != LIBUSB_SUCCESS) {
            RLOG_WARN("usb", "Failed to open %04x:%04x: %s",
                      desc.idVendor, desc.idProduct, libusb_error_name(open_rc));
            handle_ = nullptr;
            continue;
        }
        vid_ = desc.idVendor;
        pid_ = desc.idProduct;
    }
    libusb_free_device_list(devs, 1);

    if (!handle_) {
        libusb_exit(ctx_);
        ctx_ = nullptr;
        if (open_rc == LIBUSB_ERROR_NOT_FOUND) {
            RLOG_INFO("usb", "No recorder found (VID=%04x PID=%04x)", vendor_id, product_id);
        }
        return usb_error("open", open_rc);
    }

    // Linux: let libusb detach usbfs/kernel drivers around our claim
    libusb_set_auto_detach_kernel_driver(handle_, 1);

    disconnect_fired_.store(false);
    open_.store(true);
    RLOG_INFO("usb", "Opened %s (VID=%04x PID=%04x)",
              model_name(model_from_product_id(pid_)), vid_, pid_);
    return Result<void, ProtocolError>();
}

Result<void, ProtocolError> LibusbTransport::claim_interface(int configuration, int interface_number,
                                                             int alt_setting) {
    if (!handle_) {
        return protocolError(ProtocolError::Kind::NotConnected, "claim_interface: device not open");
    }

    int current = 0;
    int rc = libusb_get_configuration(handle_, &current);
    if (rc == LIBUSB_SUCCESS && current != configuration) {
        rc = libusb_set_configuration(handle_, configuration);
        if (rc != LIBUSB_SUCCESS) {
            RLOG_ERROR("usb", "set_configuration(%d) failed: %s", configuration, libusb_error_name(rc));
            return usb_error("libusb_set_configuration", rc);
        }
    }

    rc = libusb_claim_interface(handle_, interface_number);
    if (rc != LIBUSB_SUCCESS) {
        RLOG_ERROR("usb", "Failed to claim interface %d: %s", interface_number, libusb_error_name(rc));
        return usb_error("libusb_claim_interface", rc);
    }
    claimed_interface_ = interface_number;

    rc = libusb_set_interface_alt_setting(handle_, interface_number, alt_setting);
    if (rc != LIBUSB_SUCCESS) {
        RLOG_ERROR("usb", "Failed to select alt setting %d: %s", alt_setting, libusb_error_name(rc));
        return usb_error("libusb_set_interface_alt_setting", rc);
    }

    RLOG_INFO("usb", "Claimed config=%d interface=%d alt=%d", configuration, interface_number, alt_setting);
    return Result<void, ProtocolError>();
}

Result<size_t, ProtocolError> LibusbTransport::write(uint8_t endpoint, const uint8_t* data, size_t len) {
    if (!open_.load() || !handle_) {
        return protocolError(ProtocolError::Kind::NotConnected, "write: device not open");
    }

    int transferred = 0;
    int rc = libusb_bulk_transfer(handle_, endpoint, const_cast<uint8_t*>(data), (int)len,
                                  &transferred, write_timeout_ms_);
    if (rc != LIBUSB_SUCCESS) {
        RLOG_ERROR("usb", "USB send error: %s", libusb_error_name(rc));
        handle_fatal(rc);
        return usb_error("bulk write", rc);
    }

    if (transferred != (int)len) {
        RLOG_WARN("usb", "Partial transfer: sent %d of %zu bytes", transferred, len);
        return protocolError(ProtocolError::Kind::Transport, "short write", transferred);
    }
    return static_cast<size_t>(transferred);
}

Result<std::vector<uint8_t>, ProtocolError> LibusbTransport::read(uint8_t endpoint, size_t max_bytes) {
    if (!open_.load() || !handle_) {
        return protocolError(ProtocolError::Kind::NotConnected, "read: device not open");
    }

    std::vector<uint8_t> buf(max_bytes);
    int transferred = 0;
    int rc = libusb_bulk_transfer(handle_, endpoint, buf.data(), (int)buf.size(),
                                  &transferred, read_timeout_ms_);

    if (rc == LIBUSB_SUCCESS || (rc == LIBUSB_ERROR_TIMEOUT && transferred > 0)) {
        buf.resize(static_cast<size_t>(transferred));
        return buf;
    }
    if (rc == LIBUSB_ERROR_TIMEOUT) {
        // Timeout is normal
        return protocolError(ProtocolError::Kind::Timeout, "read idle", rc);
    }

    RLOG_ERROR("usb", "USB receive error: %s", libusb_error_name(rc));
    handle_fatal(rc);
    return usb_error("bulk read", rc);
}

void LibusbTransport::handle_fatal(int rc) {
    if (rc != LIBUSB_ERROR_NO_DEVICE && rc != LIBUSB_ERROR_IO && rc != LIBUSB_ERROR_PIPE) return;

    open_.store(false);
    if (disconnect_fired_.exchange(true)) return;

    RLOG_WARN("usb", "Device lost (%s)", libusb_error_name(rc));
    DisconnectCallback cb;
    {
        std::lock_guard<std::mutex> lock(cb_mutex_);
        cb = disconnect_cb_;
    }
    if (cb) cb();
}

void LibusbTransport::close() {
    open_.store(false);

    if (handle_) {
        if (claimed_interface_ >= 0) {
            libusb_release_interface(handle_, claimed_interface_);
            claimed_interface_ = -1;
        }
        libusb_close(handle_);
        handle_ = nullptr;
        RLOG_INFO("usb", "Closed device %04x:%04x", vid_, pid_);
    }

    if (ctx_) {
        libusb_exit(ctx_);
        ctx_ = nullptr;
    }
}

} // namespace recdock
