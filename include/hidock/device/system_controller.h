#pragma once

#include <atomic>
#include <cstdint>

#include "hidock/core/logging.h"
#include "hidock/device/device_session.h"
#include "hidock/device/device_types.h"
#include "hidock/device/transfer_engine.h"
#include "hidock/io/io_status.h"

namespace hidock::device {

// Storage, power, maintenance and firmware/tone/UAC updates.
class SystemController {
public:
    SystemController(DeviceSession& session, TransferEngine& transfers)
        : _session(session)
        , _transfers(transfers)
        , _log(session.logger().with_tag("system"))
    {}

    // Re-reads version and serial from the device.
    io::Result<DeviceInfo> device_info();

    io::IOResult factory_reset();
    io::IOResult restore_factory_settings();
    io::IOResult format_card();
    io::Result<CardInfo> card_info();
    io::Result<BatteryStatus> battery_status();
    io::IOResult enter_mass_storage();

    io::Result<std::uint32_t> webusb_timeout();
    io::IOResult set_webusb_timeout(std::uint32_t value);

    io::IOResult send_key_code(std::uint8_t mode, std::uint8_t key);
    io::IOResult record_test_start(std::uint8_t type);
    io::IOResult record_test_end(std::uint8_t type);
    io::IOResult begin_bnc();
    io::IOResult end_bnc();

    // Firmware: announce, then stream 512-byte chunks.
    io::Result<UpdateResult> request_firmware_upgrade(std::uint32_t versionNumber,
                                                      std::uint32_t fileSize);
    io::TransferResult upload_firmware(const io::protocol::ByteBuffer& image,
                                       const ProgressFn& onProgress = {},
                                       const std::atomic<bool>* cancel = nullptr);

    // Tone / UAC: announce with MD5 + size, then send the whole image at once.
    io::Result<UpdateResult> request_tone_update(const io::protocol::ByteBuffer& image);
    io::IOResult update_tone(const io::protocol::ByteBuffer& image);
    io::Result<UpdateResult> request_uac_update(const io::protocol::ByteBuffer& image);
    io::IOResult update_uac(const io::protocol::ByteBuffer& image);

private:
    // Sends and treats a non-zero first response byte as CommandFailed.
    io::IOResult checked(io::protocol::CommandId id,
                         io::protocol::ByteBuffer body,
                         io::Millis timeout,
                         const char* what);
    io::Result<UpdateResult> request_update(io::protocol::CommandId id,
                                            const io::protocol::ByteBuffer& image);

    DeviceSession&  _session;
    TransferEngine& _transfers;
    log::Logger     _log;
};

} // namespace hidock::device
