#include "hidock/device/settings_controller.h"
#include "hidock/io/protocol/command_ids.h"

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::protocol::ByteBuffer;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::Message;

static constexpr std::uint8_t kOn  = 1;
static constexpr std::uint8_t kOff = 2;

io::Result<DeviceSettings> SettingsController::get()
{
    if (!_session.capabilities().auto_record_settings()) {
        // Old H1/H1E firmware has no settings record.
        return io::Result<DeviceSettings>::success(DeviceSettings{});
    }

    Command cmd(CommandId::GetSettings);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return io::Result<DeviceSettings>::failure(r);
    }
    if (resp.body.size() < 16) {
        return io::Result<DeviceSettings>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "settings body too short"));
    }

    DeviceSettings s;
    s.autoRecord    = resp.body[3] == 1;
    s.autoPlay      = resp.body[7] == 1;
    s.notification  = resp.body[11] == 1;
    s.bluetoothTone = resp.body[15] != 1;   // inverted on the wire
    return io::Result<DeviceSettings>::success(s);
}

IOResult SettingsController::set_auto_record(bool enabled)
{
    return write_slot(3, enabled ? kOn : kOff);
}

IOResult SettingsController::set_auto_play(bool enabled)
{
    return write_slot(7, enabled ? kOn : kOff);
}

IOResult SettingsController::set_notification(bool enabled)
{
    return write_slot(11, enabled ? kOn : kOff);
}

IOResult SettingsController::set_bluetooth_tone(bool enabled)
{
    return write_slot(15, enabled ? kOff : kOn);
}

IOResult SettingsController::write_slot(std::size_t index, std::uint8_t value)
{
    ByteBuffer body(index + 1, 0);
    body[index] = value;

    Command cmd(CommandId::SetSettings, std::move(body));
    Message resp;
    return _session.send(cmd, resp);
}

} // namespace hidock::device
