#pragma once

#include "hidock/config/hidock_config.h"
#include "hidock/console/console_commands.h"
#include "hidock/console/console_transport.h"
#include "hidock/device/bluetooth_controller.h"
#include "hidock/device/device_session.h"
#include "hidock/device/file_controller.h"
#include "hidock/device/settings_controller.h"
#include "hidock/device/system_controller.h"
#include "hidock/device/time_controller.h"
#include "hidock/firmware/firmware_catalog.h"

#include <functional>
#include <string>
#include <vector>

namespace hidock::console {

// Everything the device commands act on. Not owning.
struct DeviceCommandContext {
    device::DeviceSession&       session;
    device::FileController&      files;
    device::TimeController&      clock;
    device::SettingsController&  settings;
    device::BluetoothController& bluetooth;
    device::SystemController&    system;
    firmware::FirmwareCatalog*   firmware{nullptr};   // null disables fw-check
    std::string                  accessToken;

    // One line per attached recorder, for "devices".
    std::function<std::vector<std::string>()> listDevices;
};

// Registers help, info, devices, time, time-sync, ls, count, get, rm,
// settings, set, card, battery, bt-*, fw-check and quit.
void register_device_commands(ConsoleCommandRegistry& registry,
                              IConsoleTransport& io,
                              DeviceCommandContext& ctx);

} // namespace hidock::console
