#pragma once

#include <ctime>
#include <string>

#include "hidock/device/device_session.h"
#include "hidock/io/io_status.h"

namespace hidock::device {

class TimeController {
public:
    explicit TimeController(DeviceSession& session) : _session(session) {}

    // "YYYY-MM-DD HH:MM:SS", or "unknown" when the clock was never set.
    io::Result<std::string> get();

    io::IOResult set(const std::tm& localTime);

    // Sets the device clock to the host's local time.
    io::IOResult sync_now();

private:
    DeviceSession& _session;
};

} // namespace hidock::device
