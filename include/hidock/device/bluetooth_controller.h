#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "hidock/device/device_session.h"
#include "hidock/device/device_types.h"
#include "hidock/io/io_status.h"

namespace hidock::device {

using MacAddress = std::array<std::uint8_t, 6>;

// Accepts "AA-BB-CC-DD-EE-FF" or "AA:BB:CC:DD:EE:FF".
bool parse_mac(std::string_view text, MacAddress& out);

// "AA-BB-CC-DD-EE-FF".
std::string format_mac(const std::uint8_t* bytes);

// Bluetooth headset pairing. P1 family only; other models get Unsupported.
class BluetoothController {
public:
    explicit BluetoothController(DeviceSession& session)
        : _session(session)
        , _log(session.logger().with_tag("bt"))
    {}

    io::Result<BluetoothStatus> status();

    io::IOResult start_scan(int seconds = 30);
    io::IOResult stop_scan();
    io::Result<std::vector<ScannedDevice>> scan_results();

    io::IOResult connect(std::string_view mac);
    io::IOResult disconnect();
    io::IOResult reconnect(std::string_view mac);

    io::IOResult clear_paired();
    io::Result<std::vector<PairedDevice>> paired_devices();

private:
    io::IOResult require_p1() const;
    io::IOResult simple(io::protocol::CommandId id, io::protocol::ByteBuffer body);
    io::IOResult mac_command(std::uint8_t sub, std::string_view mac);

    DeviceSession& _session;
    log::Logger    _log;
};

} // namespace hidock::device
