#include "hidock/device/bluetooth_controller.h"
#include "hidock/io/protocol/byte_codec.h"
#include "hidock/io/protocol/command_ids.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::Result;
using io::protocol::ByteBuffer;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::Message;

namespace {

enum class BtSubCommand : std::uint8_t {
    Connect    = 0,
    Disconnect = 1,
    Reconnect  = 3,
};

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

bool parse_mac(std::string_view text, MacAddress& out)
{
    std::size_t part = 0;
    std::size_t i = 0;
    while (part < 6) {
        int value = 0;
        std::size_t digits = 0;
        while (i < text.size() && digits < 2) {
            const int v = hex_value(text[i]);
            if (v < 0) break;
            value = (value << 4) | v;
            ++digits;
            ++i;
        }
        if (digits == 0) {
            return false;
        }
        out[part++] = static_cast<std::uint8_t>(value);

        if (part < 6) {
            if (i >= text.size() || (text[i] != '-' && text[i] != ':')) {
                return false;
            }
            ++i;
        }
    }
    return i == text.size();
}

std::string format_mac(const std::uint8_t* bytes)
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X-%02X-%02X-%02X-%02X-%02X",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    return buf;
}

IOResult BluetoothController::require_p1() const
{
    if (!_session.capabilities().bluetooth()) {
        return IOResult::failure(IOStatus::Unsupported, "bluetooth requires a P1 model");
    }
    return IOResult::success();
}

IOResult BluetoothController::simple(CommandId id, ByteBuffer body)
{
    IOResult r = require_p1();
    if (!r.ok()) {
        return r;
    }
    Command cmd(id, std::move(body));
    Message resp;
    return _session.send(cmd, resp);
}

Result<BluetoothStatus> BluetoothController::status()
{
    IOResult r = require_p1();
    if (!r.ok()) {
        return Result<BluetoothStatus>::failure(r);
    }

    Command cmd(CommandId::BluetoothStatus);
    Message resp;
    r = _session.send(cmd, resp);
    if (!r.ok()) {
        return Result<BluetoothStatus>::failure(r);
    }

    BluetoothStatus st;
    if (resp.body.empty()) {
        return Result<BluetoothStatus>::success(st);
    }

    switch (resp.body[0]) {
    case 1: st.state = BluetoothLinkState::Disconnected; return Result<BluetoothStatus>::success(st);
    case 2: st.state = BluetoothLinkState::Scanning;     return Result<BluetoothStatus>::success(st);
    case 3: st.state = BluetoothLinkState::Connecting;   return Result<BluetoothStatus>::success(st);
    default: break;
    }

    st.state = BluetoothLinkState::Connected;

    // Connected: name, MAC and profile flags follow; any of them may be cut short.
    io::bytecodec::Reader rd(resp.body);
    rd.skip(1);
    std::uint16_t nameLen = 0;
    if (!rd.read_u16be(nameLen)) {
        return Result<BluetoothStatus>::success(st);
    }
    std::string_view name;
    const std::size_t avail = std::min<std::size_t>(nameLen, rd.remaining());
    rd.read_sv(name, avail);
    st.name = std::string(name);

    const std::uint8_t* mac = nullptr;
    if (rd.read_bytes(mac, 6)) {
        st.mac = format_mac(mac);
    }

    const std::uint8_t* flags = nullptr;
    if (rd.read_bytes(flags, 4)) {
        st.hasProfiles = true;
        st.a2dp = flags[0] == 1;
        st.hfp = flags[1] == 1;
        st.avrcp = flags[2] == 1;
        st.batteryPercent = static_cast<int>(static_cast<double>(flags[3]) / 255.0 * 100.0);
    }
    return Result<BluetoothStatus>::success(st);
}

IOResult BluetoothController::start_scan(int seconds)
{
    const auto dur = static_cast<std::uint8_t>(std::clamp(seconds, 0, 255));
    return simple(CommandId::BtScan, ByteBuffer{1, dur});
}

IOResult BluetoothController::stop_scan()
{
    return simple(CommandId::BtScan, ByteBuffer{0, 0});
}

Result<std::vector<ScannedDevice>> BluetoothController::scan_results()
{
    using ScanResult = Result<std::vector<ScannedDevice>>;

    IOResult r = require_p1();
    if (!r.ok()) {
        return ScanResult::failure(r);
    }

    Command cmd(CommandId::BtDevList);
    Message resp;
    r = _session.send(cmd, resp);
    if (!r.ok()) {
        return ScanResult::failure(r);
    }

    std::vector<ScannedDevice> devices;
    io::bytecodec::Reader rd(resp.body);
    std::uint16_t count = 0;
    if (!rd.read_u16be(count)) {
        return ScanResult::success(std::move(devices));
    }

    for (std::uint16_t i = 0; i < count; ++i) {
        std::string_view name;
        const std::uint8_t* mac = nullptr;
        std::int8_t rssi = 0;
        std::uint32_t cod = 0;
        if (!rd.read_lp_u16_string(name) ||
            !rd.read_bytes(mac, 6) ||
            !rd.read_i8(rssi) ||
            !rd.read_u24be(cod)) {
            break;
        }

        ScannedDevice d;
        d.name = std::string(name);
        d.mac = format_mac(mac);
        d.rssi = rssi;
        d.classOfDevice = cod;
        d.audio = ((cod & 0x1F00) >> 8) == 4;   // major class: audio/video
        devices.push_back(std::move(d));
    }

    HD_LOGD(_log, "scan results: %zu devices", devices.size());
    return ScanResult::success(std::move(devices));
}

IOResult BluetoothController::mac_command(std::uint8_t sub, std::string_view mac)
{
    MacAddress addr{};
    if (!parse_mac(mac, addr)) {
        return IOResult::failure(IOStatus::InvalidArgument, "invalid MAC address: " + std::string(mac));
    }
    ByteBuffer body{sub};
    body.insert(body.end(), addr.begin(), addr.end());
    return simple(CommandId::BluetoothCmd, std::move(body));
}

IOResult BluetoothController::connect(std::string_view mac)
{
    return mac_command(static_cast<std::uint8_t>(BtSubCommand::Connect), mac);
}

IOResult BluetoothController::disconnect()
{
    return simple(CommandId::BluetoothCmd,
                  ByteBuffer{static_cast<std::uint8_t>(BtSubCommand::Disconnect)});
}

IOResult BluetoothController::reconnect(std::string_view mac)
{
    return mac_command(static_cast<std::uint8_t>(BtSubCommand::Reconnect), mac);
}

IOResult BluetoothController::clear_paired()
{
    return simple(CommandId::BtRemovePairedDev, ByteBuffer{0});
}

Result<std::vector<PairedDevice>> BluetoothController::paired_devices()
{
    using PairedResult = Result<std::vector<PairedDevice>>;

    IOResult r = require_p1();
    if (!r.ok()) {
        return PairedResult::failure(r);
    }

    Command cmd(CommandId::BtGetPairedDevList);
    Message resp;
    r = _session.send(cmd, resp);
    if (!r.ok()) {
        return PairedResult::failure(r);
    }

    std::vector<PairedDevice> devices;
    io::bytecodec::Reader rd(resp.body);
    std::uint16_t count = 0;
    if (!rd.read_u16be(count)) {
        return PairedResult::success(std::move(devices));
    }

    for (std::uint16_t i = 0; i < count; ++i) {
        std::string_view name;
        const std::uint8_t* mac = nullptr;
        std::uint8_t seq = 0;
        if (!rd.read_lp_u16_string(name) ||
            !rd.read_bytes(mac, 6) ||
            !rd.read_u8(seq)) {
            break;
        }
        // Empty slots are reported with a "UUUU..." placeholder name.
        if (name.substr(0, 4) == "UUUU") {
            continue;
        }
        devices.push_back(PairedDevice{std::string(name), format_mac(mac), seq});
    }
    return PairedResult::success(std::move(devices));
}

} // namespace hidock::device
