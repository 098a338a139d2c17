#include "hidock/platform/posix/usb_transport.h"

#include <algorithm>
#include <limits>
#include <memory>
#include <string>

#include <libusb.h>

namespace hidock::platform::posix {

using io::IOResult;
using io::IOStatus;

namespace {

libusb_context* g_libusb_ctx = nullptr;
std::once_flag  g_libusb_once;

bool ensure_libusb_initialized()
{
    std::call_once(g_libusb_once, []() {
        if (libusb_init(&g_libusb_ctx) != 0) {
            g_libusb_ctx = nullptr;
        }
    });
    return g_libusb_ctx != nullptr;
}

int clamp_size_to_int(std::size_t sz)
{
    if (sz > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(sz);
}

// libusb treats 0 as "wait forever".
unsigned int to_libusb_timeout(io::Millis timeout)
{
    const auto ms = timeout.count();
    if (ms <= 0) {
        return 1;
    }
    if (ms > std::numeric_limits<unsigned int>::max()) {
        return std::numeric_limits<unsigned int>::max();
    }
    return static_cast<unsigned int>(ms);
}

bool vendor_wanted(const config::UsbConfig& cfg, std::uint16_t vid)
{
    return std::find(cfg.vendorIds.begin(), cfg.vendorIds.end(), vid) != cfg.vendorIds.end();
}

struct DeviceListDeleter {
    void operator()(libusb_device** list) const { libusb_free_device_list(list, 1); }
};

} // namespace

std::vector<UsbDeviceEntry> list_devices(const config::UsbConfig& cfg, const log::Logger& logger)
{
    std::vector<UsbDeviceEntry> found;
    if (!ensure_libusb_initialized()) {
        HD_LOGE(logger, "libusb_init failed");
        return found;
    }

    libusb_device** raw = nullptr;
    const ssize_t count = libusb_get_device_list(g_libusb_ctx, &raw);
    if (count < 0) {
        HD_LOGE(logger, "libusb_get_device_list: %s", libusb_error_name(static_cast<int>(count)));
        return found;
    }
    std::unique_ptr<libusb_device*, DeviceListDeleter> list(raw);

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device* dev = raw[i];
        libusb_device_descriptor desc{};
        if (libusb_get_device_descriptor(dev, &desc) != 0) {
            continue;
        }
        if (!vendor_wanted(cfg, desc.idVendor)) {
            continue;
        }
        UsbDeviceEntry e;
        e.bus       = libusb_get_bus_number(dev);
        e.address   = libusb_get_device_address(dev);
        e.vendorId  = desc.idVendor;
        e.productId = desc.idProduct;
        e.model     = device::model_from_product_id(desc.idProduct);
        found.push_back(e);
    }
    return found;
}

UsbTransport::UsbTransport(config::UsbConfig cfg, log::Logger logger)
    : _cfg(std::move(cfg))
    , _log(logger.with_tag("usb"))
{
}

UsbTransport::~UsbTransport()
{
    disconnect();
}

IOResult UsbTransport::connect()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_handle) {
        return IOResult::success();
    }
    if (!ensure_libusb_initialized()) {
        return IOResult::failure(IOStatus::ConnectionFailed, "libusb_init failed");
    }

    libusb_device** raw = nullptr;
    const ssize_t count = libusb_get_device_list(g_libusb_ctx, &raw);
    if (count < 0) {
        return IOResult::failure(IOStatus::ConnectionFailed, libusb_error_name(static_cast<int>(count)));
    }
    std::unique_ptr<libusb_device*, DeviceListDeleter> list(raw);

    libusb_device* chosen = nullptr;
    libusb_device_descriptor chosenDesc{};
    for (ssize_t i = 0; i < count && !chosen; ++i) {
        libusb_device* dev = raw[i];
        libusb_device_descriptor desc{};
        if (libusb_get_device_descriptor(dev, &desc) != 0 || !vendor_wanted(_cfg, desc.idVendor)) {
            continue;
        }
        if (_selected && (libusb_get_bus_number(dev) != _selected->first
                          || libusb_get_device_address(dev) != _selected->second)) {
            continue;
        }
        chosen = dev;
        chosenDesc = desc;
    }

    if (!chosen) {
        return IOResult::failure(IOStatus::ConnectionFailed, "no HiDock device found");
    }

    libusb_device_handle* handle = nullptr;
    int rc = libusb_open(chosen, &handle);
    if (rc != 0) {
        HD_LOGE(_log, "libusb_open: %s", libusb_error_name(rc));
        return IOResult::failure(IOStatus::ConnectionFailed, std::string("open failed: ") + libusb_error_name(rc));
    }

    bool detached = false;
    if (libusb_kernel_driver_active(handle, _cfg.interfaceNumber) == 1) {
        rc = libusb_detach_kernel_driver(handle, _cfg.interfaceNumber);
        if (rc == 0) {
            detached = true;
        } else {
            HD_LOGW(_log, "could not detach kernel driver: %s", libusb_error_name(rc));
        }
    }

    rc = libusb_claim_interface(handle, _cfg.interfaceNumber);
    if (rc != 0) {
        HD_LOGE(_log, "claim interface %d: %s", _cfg.interfaceNumber, libusb_error_name(rc));
        if (detached) {
            (void)libusb_attach_kernel_driver(handle, _cfg.interfaceNumber);
        }
        libusb_close(handle);
        const char* why = (rc == LIBUSB_ERROR_BUSY) ? "device busy (claimed by another program)"
                                                    : libusb_error_name(rc);
        return IOResult::failure(IOStatus::ConnectionFailed, why);
    }

    _handle = handle;
    _kernelDriverDetached = detached;
    _model = device::model_from_product_id(chosenDesc.idProduct);
    _readBuf.assign(std::max<std::size_t>(_cfg.readBufferSize, 64), 0);
    _connected = true;

    HD_LOGI(_log, "opened %04x:%04x (%s)", (unsigned)chosenDesc.idVendor,
            (unsigned)chosenDesc.idProduct, device::model_name(_model));
    return IOResult::success();
}

void UsbTransport::close_locked()
{
    if (!_handle) {
        return;
    }
    (void)libusb_release_interface(_handle, _cfg.interfaceNumber);
    if (_kernelDriverDetached) {
        (void)libusb_attach_kernel_driver(_handle, _cfg.interfaceNumber);
        _kernelDriverDetached = false;
    }
    libusb_close(_handle);
    _handle = nullptr;
    _connected = false;
    HD_LOGI(_log, "closed");
}

void UsbTransport::disconnect()
{
    std::lock_guard<std::mutex> lock(_mutex);
    close_locked();
}

IOResult UsbTransport::send(const io::protocol::ByteBuffer& bytes)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_handle) {
        return IOResult::failure(IOStatus::NotConnected);
    }

    std::size_t offset = 0;
    while (offset < bytes.size()) {
        int actual = 0;
        const int rc = libusb_bulk_transfer(_handle, _cfg.endpointOut,
                                            const_cast<unsigned char*>(bytes.data() + offset),
                                            clamp_size_to_int(bytes.size() - offset),
                                            &actual, 5000);
        if (actual > 0) {
            offset += static_cast<std::size_t>(actual);
        }
        if (rc == LIBUSB_ERROR_NO_DEVICE) {
            close_locked();
            return IOResult::failure(IOStatus::NotConnected, "device removed");
        }
        if (rc != 0) {
            if (rc == LIBUSB_ERROR_PIPE) {
                (void)libusb_clear_halt(_handle, _cfg.endpointOut);
            }
            HD_LOGE(_log, "bulk write: %s", libusb_error_name(rc));
            return IOResult::failure(IOStatus::IOError, std::string("write failed: ") + libusb_error_name(rc));
        }
        if (actual <= 0) {
            return IOResult::failure(IOStatus::IOError, "bulk write returned zero length");
        }
    }

    HD_LOGV(_log, "sent %zu bytes", bytes.size());
    return IOResult::success();
}

IOResult UsbTransport::receive(io::protocol::ByteBuffer& out, io::Millis timeout)
{
    std::lock_guard<std::mutex> lock(_mutex);
    out.clear();
    if (!_handle) {
        return IOResult::failure(IOStatus::NotConnected);
    }

    int actual = 0;
    const int rc = libusb_bulk_transfer(_handle, _cfg.endpointIn, _readBuf.data(),
                                        clamp_size_to_int(_readBuf.size()), &actual,
                                        to_libusb_timeout(timeout));

    if (actual > 0) {
        out.assign(_readBuf.begin(), _readBuf.begin() + actual);
    }

    switch (rc) {
    case 0:
        HD_LOGV(_log, "received %d bytes", actual);
        return IOResult::success();
    case LIBUSB_ERROR_TIMEOUT:
        return actual > 0 ? IOResult::success() : IOResult::failure(IOStatus::Timeout);
    case LIBUSB_ERROR_NO_DEVICE:
        close_locked();
        return IOResult::failure(IOStatus::NotConnected, "device removed");
    case LIBUSB_ERROR_PIPE:
        (void)libusb_clear_halt(_handle, _cfg.endpointIn);
        [[fallthrough]];
    default:
        HD_LOGE(_log, "bulk read: %s", libusb_error_name(rc));
        return IOResult::failure(IOStatus::IOError, std::string("read failed: ") + libusb_error_name(rc));
    }
}

} // namespace hidock::platform::posix
