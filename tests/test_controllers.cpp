#include "doctest.h"

#include "mock_transport.h"

#include "hidock/crypto/md5.h"
#include "hidock/device/bluetooth_controller.h"
#include "hidock/device/device_session.h"
#include "hidock/device/keep_alive.h"
#include "hidock/device/settings_controller.h"
#include "hidock/device/system_controller.h"
#include "hidock/device/time_controller.h"
#include "hidock/device/transfer_engine.h"

#include <chrono>
#include <ctime>
#include <thread>

using namespace hidock;
using namespace hidock::tests;
using device::DeviceModel;

namespace {

struct Rig {
    MockTransport          transport;
    device::DeviceSession  session{transport, {}, device::SessionOptions{io::Millis(100), io::Millis(50)}};
    device::TransferEngine transfers{session, device::TransferOptions{io::Millis(100), 512}};

    explicit Rig(DeviceModel model = DeviceModel::P1, std::uint32_t version = 0x00060102)
    {
        transport.deviceModel = model;
        transport.infoBody = device_info_body(version, "SN");
        REQUIRE(session.connect().ok());
    }

    void ack(CommandId id, ByteBuffer body = {0})
    {
        transport.on(id, [body](const Message& m, MockTransport& t) { t.reply(m, body); });
    }
};

} // namespace

// ---------- time ----------

TEST_CASE("TimeController: reads BCD clock")
{
    Rig rig;
    device::TimeController clock(rig.session);

    rig.ack(CommandId::QueryDeviceTime, {0x20, 0x25, 0x01, 0x02, 0x03, 0x04, 0x05});
    auto r = clock.get();
    REQUIRE(r.ok());
    CHECK(r.value == "2025-01-02 03:04:05");

    rig.ack(CommandId::QueryDeviceTime, ByteBuffer(7, 0));
    r = clock.get();
    REQUIRE(r.ok());
    CHECK(r.value == "unknown");

    rig.ack(CommandId::QueryDeviceTime, {0x20, 0x25});
    CHECK(clock.get().error.status == IOStatus::InvalidResponse);
}

TEST_CASE("TimeController: set sends seven BCD bytes")
{
    Rig rig;
    device::TimeController clock(rig.session);
    rig.ack(CommandId::SetDeviceTime);

    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon = 11;
    tm.tm_mday = 31;
    tm.tm_hour = 23;
    tm.tm_min = 59;
    tm.tm_sec = 58;
    REQUIRE(clock.set(tm).ok());

    const auto sent = rig.transport.sent_with(CommandId::SetDeviceTime);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].body == ByteBuffer{0x20, 0x25, 0x12, 0x31, 0x23, 0x59, 0x58});
}

// ---------- settings ----------

TEST_CASE("SettingsController: decode flags")
{
    Rig rig;
    device::SettingsController settings(rig.session);

    ByteBuffer body(16, 0);
    body[3] = 1;
    body[7] = 2;
    body[11] = 1;
    body[15] = 1;
    rig.ack(CommandId::GetSettings, body);

    const auto r = settings.get();
    REQUIRE(r.ok());
    CHECK(r.value.autoRecord);
    CHECK_FALSE(r.value.autoPlay);
    CHECK(r.value.notification);
    CHECK_FALSE(r.value.bluetoothTone);
}

TEST_CASE("SettingsController: writes only the changed slot")
{
    Rig rig;
    device::SettingsController settings(rig.session);
    rig.ack(CommandId::SetSettings);

    REQUIRE(settings.set_auto_record(true).ok());
    REQUIRE(settings.set_bluetooth_tone(true).ok());

    const auto sent = rig.transport.sent_with(CommandId::SetSettings);
    REQUIRE(sent.size() == 2);
    CHECK(sent[0].body == ByteBuffer{0, 0, 0, 1});
    REQUIRE(sent[1].body.size() == 16);
    CHECK(sent[1].body[15] == 2);
}

TEST_CASE("SettingsController: old H1 firmware gets defaults without a request")
{
    Rig rig(DeviceModel::H1, 0x00050010);
    device::SettingsController settings(rig.session);

    const auto r = settings.get();
    REQUIRE(r.ok());
    CHECK_FALSE(r.value.autoRecord);
    CHECK(r.value.bluetoothTone);
    CHECK(rig.transport.sent_with(CommandId::GetSettings).empty());
}

// ---------- bluetooth ----------

TEST_CASE("BluetoothController: MAC parsing")
{
    device::MacAddress mac{};
    REQUIRE(device::parse_mac("AA:bb:0C-dd:EE:01", mac));
    CHECK(mac == device::MacAddress{0xAA, 0xBB, 0x0C, 0xDD, 0xEE, 0x01});
    CHECK(device::format_mac(mac.data()) == "AA-BB-0C-DD-EE-01");

    CHECK_FALSE(device::parse_mac("AA:BB:CC:DD:EE", mac));
    CHECK_FALSE(device::parse_mac("AA:BB:CC:DD:EE:FF:00", mac));
    CHECK_FALSE(device::parse_mac("GG:BB:CC:DD:EE:FF", mac));
}

TEST_CASE("BluetoothController: H1 is unsupported")
{
    Rig rig(DeviceModel::H1);
    device::BluetoothController bt(rig.session);

    CHECK(bt.status().error.status == IOStatus::Unsupported);
    CHECK(bt.start_scan().status == IOStatus::Unsupported);
    CHECK(bt.stop_scan().status == IOStatus::Unsupported);
    CHECK(rig.transport.sent.size() == 1); // handshake only
}

TEST_CASE("BluetoothController: status")
{
    Rig rig;
    device::BluetoothController bt(rig.session);

    rig.ack(CommandId::BluetoothStatus, {2});
    auto r = bt.status();
    REQUIRE(r.ok());
    CHECK(r.value.state == device::BluetoothLinkState::Scanning);

    rig.ack(CommandId::BluetoothStatus,
            {0, 0, 4, 'J', 'B', 'L', '1', 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 1, 0, 1, 255});
    r = bt.status();
    REQUIRE(r.ok());
    CHECK(r.value.state == device::BluetoothLinkState::Connected);
    CHECK(r.value.name == "JBL1");
    CHECK(r.value.mac == "11-22-33-44-55-66");
    CHECK(r.value.hasProfiles);
    CHECK(r.value.a2dp);
    CHECK_FALSE(r.value.hfp);
    CHECK(r.value.avrcp);
    CHECK(r.value.batteryPercent == 100);

    rig.ack(CommandId::BluetoothStatus, {0, 0, 2, 'X', 'Y'});
    r = bt.status();
    REQUIRE(r.ok());
    CHECK(r.value.name == "XY");
    CHECK(r.value.mac.empty());
    CHECK_FALSE(r.value.hasProfiles);
}

TEST_CASE("BluetoothController: scan, connect and lists")
{
    Rig rig;
    device::BluetoothController bt(rig.session);
    rig.ack(CommandId::BtScan);
    rig.ack(CommandId::BluetoothCmd);

    REQUIRE(bt.start_scan(500).ok());
    REQUIRE(bt.stop_scan().ok());
    auto scans = rig.transport.sent_with(CommandId::BtScan);
    REQUIRE(scans.size() == 2);
    CHECK(scans[0].body == ByteBuffer{1, 255});
    CHECK(scans[1].body == ByteBuffer{0, 0});

    REQUIRE(bt.connect("AA-BB-CC-DD-EE-FF").ok());
    CHECK(bt.connect("nope").status == IOStatus::InvalidArgument);
    const auto cmds = rig.transport.sent_with(CommandId::BluetoothCmd);
    REQUIRE(cmds.size() == 1);
    CHECK(cmds[0].body == ByteBuffer{0, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF});

    rig.ack(CommandId::BtDevList, {0, 2,
                                   0, 2, 'H', 'P', 1, 2, 3, 4, 5, 6, 0xC4, 0x24, 0x04, 0x04,
                                   0, 1, 'K', 9, 9, 9, 9, 9, 9, 0xF6, 0x00, 0x01, 0x00});
    const auto found = bt.scan_results();
    REQUIRE(found.ok());
    REQUIRE(found.value.size() == 2);
    CHECK(found.value[0].name == "HP");
    CHECK(found.value[0].rssi == -60);
    CHECK(found.value[0].audio);
    CHECK_FALSE(found.value[1].audio);

    rig.ack(CommandId::BtGetPairedDevList, {0, 2,
                                            0, 4, 'U', 'U', 'U', 'U', 0, 0, 0, 0, 0, 0, 1,
                                            0, 3, 'B', 'o', 'x', 1, 2, 3, 4, 5, 6, 2});
    const auto paired = bt.paired_devices();
    REQUIRE(paired.ok());
    REQUIRE(paired.value.size() == 1);
    CHECK(paired.value[0].name == "Box");
    CHECK(paired.value[0].sequence == 2);
}

// ---------- system ----------

TEST_CASE("SystemController: card and battery")
{
    Rig rig;
    device::SystemController sys(rig.session, rig.transfers);

    rig.ack(CommandId::ReadCardInfo, {0, 0, 0x03, 0xE8, 0, 0, 0x0F, 0xA0, 0, 0, 0, 0});
    const auto card = sys.card_info();
    REQUIRE(card.ok());
    CHECK(card.value.capacityBytes == 4000ull * 1024 * 1024);
    CHECK(card.value.usedBytes == 3000ull * 1024 * 1024);
    CHECK(card.value.statusText == "ok");

    rig.ack(CommandId::GetBatteryStatus, {1, 80, 0, 0, 0x0F, 0xA0});
    const auto bat = sys.battery_status();
    REQUIRE(bat.ok());
    CHECK(bat.value.state == device::BatteryState::Charging);
    CHECK(bat.value.percent == 80);
    CHECK(bat.value.voltage == 4000);
}

TEST_CASE("SystemController: capability gates on old H1 firmware")
{
    Rig rig(DeviceModel::H1, 0x00050008);
    device::SystemController sys(rig.session, rig.transfers);

    CHECK(sys.factory_reset().status == IOStatus::Unsupported);
    CHECK(sys.restore_factory_settings().status == IOStatus::Unsupported);
    CHECK(sys.card_info().error.status == IOStatus::Unsupported);
    CHECK(sys.battery_status().error.status == IOStatus::Unsupported);
}

TEST_CASE("SystemController: non-zero status byte is CommandFailed")
{
    Rig rig;
    device::SystemController sys(rig.session, rig.transfers);
    rig.ack(CommandId::FormatCard, {1});
    CHECK(sys.format_card().status == IOStatus::CommandFailed);

    const auto sent = rig.transport.sent_with(CommandId::FormatCard);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].body == ByteBuffer{1, 2, 3, 4});
}

TEST_CASE("SystemController: firmware upgrade request and upload")
{
    Rig rig;
    device::SystemController sys(rig.session, rig.transfers);

    rig.ack(CommandId::RequestFirmwareUpgrade, {1});
    const auto req = sys.request_firmware_upgrade(0x00060200, 1000);
    REQUIRE(req.ok());
    CHECK(req.value == device::UpdateResult::WrongVersion);
    const auto reqSent = rig.transport.sent_with(CommandId::RequestFirmwareUpgrade);
    REQUIRE(reqSent.size() == 1);
    CHECK(reqSent[0].body == ByteBuffer{0, 6, 2, 0, 0, 0, 0x03, 0xE8});

    rig.ack(CommandId::FirmwareUpload);
    const auto up = sys.upload_firmware(ByteBuffer(1000, 0x5A));
    REQUIRE(up.ok());
    CHECK(rig.transport.sent_with(CommandId::FirmwareUpload).size() == 2);
}

TEST_CASE("SystemController: tone update request carries MD5 and size")
{
    Rig rig;
    device::SystemController sys(rig.session, rig.transfers);
    rig.ack(CommandId::RequestToneUpdate, {0});

    const ByteBuffer image{'a', 'b', 'c'};
    const auto r = sys.request_tone_update(image);
    REQUIRE(r.ok());
    CHECK(r.value == device::UpdateResult::Accepted);

    const auto sent = rig.transport.sent_with(CommandId::RequestToneUpdate);
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].body.size() == 20);
    CHECK(crypto::to_hex(sent[0].body.data(), 16) == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(sent[0].body[19] == 3);
}

// ---------- keep-alive ----------

TEST_CASE("KeepAlive: pings while running and stops cleanly")
{
    Rig rig;
    {
        device::KeepAlive ka(rig.session, io::Millis(20));
        ka.start();
        CHECK(ka.running());
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        ka.stop();
        CHECK_FALSE(ka.running());
    }
    CHECK(rig.transport.sent_with(CommandId::QueryDeviceInfo).size() >= 3);
}
