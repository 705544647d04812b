// =============================================================================
// recdock - Transport Interface
// =============================================================================
// The narrow USB capability set the protocol engine depends on. The session
// owns its transport exclusively; LibusbTransport is the hardware binding and
// tests substitute an in-memory implementation.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>
#include "result.hpp"

namespace recdock {

class Transport {
public:
    using DisconnectCallback = std::function<void()>;

    virtual ~Transport() = default;

    // Opens the first matching device. product_id 0 accepts any known model.
    virtual Result<void, ProtocolError> open(uint16_t vendor_id, uint16_t product_id) = 0;

    // Selects the configuration and claims the interface/alt setting.
    virtual Result<void, ProtocolError> claim_interface(int configuration, int interface_number,
                                                        int alt_setting) = 0;

    // Returns bytes written. A short write is reported as Transport error.
    virtual Result<size_t, ProtocolError> write(uint8_t endpoint, const uint8_t* data,
                                                size_t len) = 0;

    // Blocks up to the transport's read timeout. An idle endpoint yields a
    // Timeout error, which callers treat as "no data yet".
    virtual Result<std::vector<uint8_t>, ProtocolError> read(uint8_t endpoint,
                                                             size_t max_bytes) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual uint16_t vendor_id() const = 0;
    virtual uint16_t product_id() const = 0;

    // Invoked at most once per open, from whichever thread observed the loss.
    virtual void set_disconnect_callback(DisconnectCallback cb) = 0;
};

} // namespace recdock
