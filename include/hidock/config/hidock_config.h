#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hidock/core/logging.h"
#include "hidock/device/device_model.h"

namespace hidock::config {

struct GeneralConfig {
    log::Level logLevel{log::Level::Info};
    bool       safeMode{false};
};

struct UsbConfig {
    std::vector<std::uint16_t> vendorIds{device::kVendorIdPrimary, device::kVendorIdSecondary};
    int           interfaceNumber{0};
    std::uint8_t  endpointOut{0x01};
    std::uint8_t  endpointIn{0x82};
    std::size_t   readBufferSize{512 * 1024};
};

struct TimeoutConfig {
    std::uint32_t commandMs{5000};
    std::uint32_t transferChunkMs{5000};
    std::uint32_t fileListMs{30000};
    std::uint32_t keepaliveIntervalMs{5000};
};

struct TransferConfig {
    std::size_t uploadChunkSize{512};
};

struct FirmwareConfig {
    std::string apiBase{"https://hinotes.hidock.com"};
    std::string accessToken;
};

struct HidockConfig {
    GeneralConfig  general;
    UsbConfig      usb;
    TimeoutConfig  timeouts;
    TransferConfig transfer;
    FirmwareConfig firmware;
};

class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual HidockConfig load() = 0;
    virtual void save(const HidockConfig& cfg) = 0;
};

} // namespace hidock::config
