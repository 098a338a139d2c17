#pragma once

#include <cstdint>
#include <string>

#include "hidock/device/device_model.h"
#include "hidock/io/protocol/frame.h"

namespace hidock::device {

struct DeviceInfo {
    DeviceModel   model{DeviceModel::Unknown};
    std::uint32_t versionNumber{0};
    std::string   versionCode;     // "b1.b2.b3"
    std::string   serialNumber;
};

// Parses a query-device-info body: u32 version, then up to 16 serial bytes
// with NULs skipped. Returns false when the body is shorter than 4 bytes.
bool parse_device_info(const io::protocol::ByteBuffer& body, DeviceInfo& out);

} // namespace hidock::device
