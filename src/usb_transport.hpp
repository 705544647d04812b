#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <libusb-1.0/libusb.h>
#include "transport.hpp"

namespace recdock {

/**
 * libusb-1.0 bulk transport for the recorder's vendor interface.
 *
 * Device lookup walks the bus for vendor_id and either the requested
 * product id or, with product_id 0, any known recorder model.
 * LIBUSB_ERROR_TIMEOUT on read is an idle poll; NO_DEVICE, IO and PIPE
 * errors close the transport and fire the disconnect callback once.
 */
class LibusbTransport : public Transport {
public:
    LibusbTransport(unsigned int read_timeout_ms = 200, unsigned int write_timeout_ms = 5000);
    ~LibusbTransport() override;

    LibusbTransport(const LibusbTransport&) = delete;
    LibusbTransport& operator=(const LibusbTransport&) = delete;

    Result<void, ProtocolError> open(uint16_t vendor_id, uint16_t product_id) override;
    Result<void, ProtocolError> claim_interface(int configuration, int interface_number,
                                                int alt_setting) override;
    Result<size_t, ProtocolError> write(uint8_t endpoint, const uint8_t* data,
                                        size_t len) override;
    Result<std::vector<uint8_t>, ProtocolError> read(uint8_t endpoint, size_t max_bytes) override;
    void close() override;
    bool is_open() const override { return open_.load(); }

    uint16_t vendor_id() const override { return vid_; }
    uint16_t product_id() const override { return pid_; }

    void set_disconnect_callback(DisconnectCallback cb) override;

private:
    ProtocolError usb_error(const char* what, int rc);
    void handle_fatal(int rc);

    unsigned int read_timeout_ms_;
    unsigned int write_timeout_ms_;

    libusb_context* ctx_ = nullptr;
    libusb_device_handle* handle_ = nullptr;
    int claimed_interface_ = -1;
    uint16_t vid_ = 0;
    uint16_t pid_ = 0;

    std::atomic<bool> open_{false};
    std::atomic<bool> disconnect_fired_{false};
    std::mutex cb_mutex_;
    DisconnectCallback disconnect_cb_;
};

} // namespace recdock
