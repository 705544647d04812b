// =============================================================================
// recdock - Device Identity
// =============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "recdock_protocol.hpp"
#include "response_types.hpp"

namespace recdock {

// Derived on every (re)connect from the USB descriptor and GetDeviceInfo.
struct DeviceIdentity {
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    Model model = Model::Unknown;
    std::optional<uint32_t> version_number;  // nullopt until GetDeviceInfo succeeds
    std::string version_code;
    std::string serial_number;
};

inline Model model_from_product_id(uint16_t product_id) {
    switch (product_id) {
        case protocol::PID_H1:  return Model::H1;
        case protocol::PID_H1E: return Model::H1E;
        case protocol::PID_P1:  return Model::P1;
        default:                return Model::Unknown;
    }
}

inline bool is_known_product(uint16_t product_id) {
    return model_from_product_id(product_id) != Model::Unknown;
}

} // namespace recdock
