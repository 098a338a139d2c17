#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "hidock/config/hidock_config.h"
#include "hidock/core/logging.h"
#include "hidock/io/transport/transport.h"

struct libusb_device_handle;

namespace hidock::platform::posix {

struct UsbDeviceEntry {
    std::uint8_t        bus{0};
    std::uint8_t        address{0};
    std::uint16_t       vendorId{0};
    std::uint16_t       productId{0};
    device::DeviceModel model{device::DeviceModel::Unknown};
};

// Every attached USB device whose vendor id appears in cfg.vendorIds.
std::vector<UsbDeviceEntry> list_devices(const config::UsbConfig& cfg, const log::Logger& logger = {});

// libusb-1.0 bulk transport for one recorder. Callers serialise send and
// receive (DeviceSession does); connect/disconnect may race with them.
class UsbTransport final : public io::ITransport {
public:
    explicit UsbTransport(config::UsbConfig cfg, log::Logger logger = {});
    ~UsbTransport() override;

    UsbTransport(const UsbTransport&) = delete;
    UsbTransport& operator=(const UsbTransport&) = delete;

    // Restrict connect() to one bus/address pair. Without it the first
    // matching device wins.
    void select(std::uint8_t bus, std::uint8_t address) { _selected = std::make_pair(bus, address); }

    io::IOResult connect() override;
    void         disconnect() override;

    io::IOResult send(const io::protocol::ByteBuffer& bytes) override;
    io::IOResult receive(io::protocol::ByteBuffer& out, io::Millis timeout) override;

    bool is_connected() const override { return _connected.load(); }

    device::DeviceModel model() const override { return _model; }

private:
    void close_locked();

    config::UsbConfig   _cfg;
    log::Logger         _log;

    std::optional<std::pair<std::uint8_t, std::uint8_t>> _selected;

    mutable std::mutex     _mutex;
    libusb_device_handle*  _handle{nullptr};
    bool                   _kernelDriverDetached{false};
    std::atomic<bool>      _connected{false};
    device::DeviceModel    _model{device::DeviceModel::Unknown};

    std::vector<std::uint8_t> _readBuf;
};

} // namespace hidock::platform::posix
