#pragma once

#include "hidock/device/device_session.h"
#include "hidock/device/device_types.h"
#include "hidock/io/io_status.h"

namespace hidock::device {

// Settings are a 16-byte record; each flag lives in the last byte of a
// 4-byte slot (3, 7, 11, 15). Writes carry only the slot being changed.
class SettingsController {
public:
    explicit SettingsController(DeviceSession& session) : _session(session) {}

    io::Result<DeviceSettings> get();

    io::IOResult set_auto_record(bool enabled);
    io::IOResult set_auto_play(bool enabled);
    io::IOResult set_notification(bool enabled);
    io::IOResult set_bluetooth_tone(bool enabled);

private:
    io::IOResult write_slot(std::size_t index, std::uint8_t value);

    DeviceSession& _session;
};

} // namespace hidock::device
