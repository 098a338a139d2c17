#include "hidock/device/system_controller.h"
#include "hidock/crypto/md5.h"
#include "hidock/io/protocol/byte_codec.h"
#include "hidock/io/protocol/command_ids.h"

#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::Millis;
using io::Result;
using io::protocol::ByteBuffer;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::Message;

static constexpr Millis kMaintenanceTimeout{5000};
static constexpr Millis kFormatTimeout{30000};
static constexpr Millis kUpdateRequestTimeout{10000};
static constexpr Millis kUpdateDataTimeout{60000};

static IOResult unsupported(const char* what)
{
    return IOResult::failure(IOStatus::Unsupported,
                             std::string(what) + " not supported by this model/firmware");
}

IOResult SystemController::checked(CommandId id, ByteBuffer body, Millis timeout, const char* what)
{
    Command cmd(id, std::move(body));
    Message resp;
    IOResult r = _session.send(cmd, resp, timeout);
    if (!r.ok()) {
        return r;
    }
    if (!resp.body.empty() && resp.body[0] != 0) {
        HD_LOGW(_log, "%s failed (status %u)", what, (unsigned)resp.body[0]);
        return IOResult::failure(IOStatus::CommandFailed, std::string(what) + " failed");
    }
    return IOResult::success();
}

Result<DeviceInfo> SystemController::device_info()
{
    Command cmd(CommandId::QueryDeviceInfo);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return Result<DeviceInfo>::failure(r);
    }

    DeviceInfo info;
    info.model = _session.model();
    if (!parse_device_info(resp.body, info)) {
        return Result<DeviceInfo>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "device info body too short"));
    }
    return Result<DeviceInfo>::success(std::move(info));
}

IOResult SystemController::factory_reset()
{
    if (!_session.capabilities().factory_reset()) {
        return unsupported("factory reset");
    }
    return checked(CommandId::FactoryReset, {}, kMaintenanceTimeout, "factory reset");
}

IOResult SystemController::restore_factory_settings()
{
    if (!_session.capabilities().restore_factory()) {
        return unsupported("restore factory settings");
    }
    return checked(CommandId::RestoreFactorySettings, {}, kMaintenanceTimeout,
                   "restore factory settings");
}

IOResult SystemController::format_card()
{
    return checked(CommandId::FormatCard, ByteBuffer{0x01, 0x02, 0x03, 0x04},
                   kFormatTimeout, "format card");
}

Result<CardInfo> SystemController::card_info()
{
    if (!_session.capabilities().card_info()) {
        return Result<CardInfo>::failure(unsupported("card info"));
    }

    Command cmd(CommandId::ReadCardInfo);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return Result<CardInfo>::failure(r);
    }

    io::bytecodec::Reader rd(resp.body);
    std::uint32_t freeMb = 0;
    std::uint32_t capacityMb = 0;
    std::uint32_t status = 0;
    if (!rd.read_u32be(freeMb) || !rd.read_u32be(capacityMb) || !rd.read_u32be(status)) {
        return Result<CardInfo>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "card info body too short"));
    }

    constexpr std::uint64_t kMiB = 1024ull * 1024ull;
    const std::uint64_t usedMb = capacityMb > freeMb ? capacityMb - freeMb : 0;

    CardInfo info;
    info.usedBytes = usedMb * kMiB;
    info.capacityBytes = static_cast<std::uint64_t>(capacityMb) * kMiB;
    switch (status) {
    case 0: info.status = CardStatus::Ok;     info.statusText = "ok";      break;
    case 1: info.status = CardStatus::Full;   info.statusText = "full";    break;
    case 2: info.status = CardStatus::Error;  info.statusText = "error";   break;
    case 3: info.status = CardStatus::NoCard; info.statusText = "no_card"; break;
    default: {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%x", (unsigned)status);
        info.status = CardStatus::Other;
        info.statusText = buf;
        break;
    }
    }
    return Result<CardInfo>::success(std::move(info));
}

Result<BatteryStatus> SystemController::battery_status()
{
    if (!_session.capabilities().battery_status()) {
        return Result<BatteryStatus>::failure(unsupported("battery status"));
    }

    Command cmd(CommandId::GetBatteryStatus);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return Result<BatteryStatus>::failure(r);
    }

    io::bytecodec::Reader rd(resp.body);
    std::uint8_t state = 0;
    std::uint8_t percent = 0;
    std::uint32_t voltage = 0;
    if (!rd.read_u8(state) || !rd.read_u8(percent) || !rd.read_u32be(voltage)) {
        return Result<BatteryStatus>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "battery body too short"));
    }

    BatteryStatus b;
    switch (state) {
    case 0: b.state = BatteryState::Idle; break;
    case 1: b.state = BatteryState::Charging; break;
    case 2: b.state = BatteryState::Full; break;
    default: b.state = BatteryState::Unknown; break;
    }
    b.percent = percent;
    b.voltage = voltage;
    return Result<BatteryStatus>::success(b);
}

IOResult SystemController::enter_mass_storage()
{
    Command cmd(CommandId::EnterMassStorage, ByteBuffer{0x01});
    Message resp;
    return _session.send(cmd, resp);
}

Result<std::uint32_t> SystemController::webusb_timeout()
{
    Command cmd(CommandId::ReadWebusbTimeout);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return Result<std::uint32_t>::failure(r);
    }
    io::bytecodec::Reader rd(resp.body);
    std::uint32_t v = 0;
    if (!rd.read_u32be(v)) {
        return Result<std::uint32_t>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "webusb timeout body too short"));
    }
    return Result<std::uint32_t>::success(v);
}

IOResult SystemController::set_webusb_timeout(std::uint32_t value)
{
    ByteBuffer body;
    io::bytecodec::write_u32be(body, value);
    Command cmd(CommandId::WriteWebusbTimeout, std::move(body));
    Message resp;
    return _session.send(cmd, resp);
}

IOResult SystemController::send_key_code(std::uint8_t mode, std::uint8_t key)
{
    return checked(CommandId::SendKeyCode, ByteBuffer{mode, key}, kMaintenanceTimeout, "send key");
}

IOResult SystemController::record_test_start(std::uint8_t type)
{
    Command cmd(CommandId::RecordTestStart, ByteBuffer{type});
    Message resp;
    return _session.send(cmd, resp);
}

IOResult SystemController::record_test_end(std::uint8_t type)
{
    Command cmd(CommandId::RecordTestEnd, ByteBuffer{type});
    Message resp;
    return _session.send(cmd, resp);
}

IOResult SystemController::begin_bnc()
{
    Command cmd(CommandId::DeviceMsgTest, ByteBuffer{1});
    Message resp;
    return _session.send(cmd, resp);
}

IOResult SystemController::end_bnc()
{
    Command cmd(CommandId::DeviceMsgTest, ByteBuffer{0});
    Message resp;
    return _session.send(cmd, resp);
}

// ---------- updates ----------

Result<UpdateResult> SystemController::request_firmware_upgrade(std::uint32_t versionNumber,
                                                                std::uint32_t fileSize)
{
    ByteBuffer body;
    io::bytecodec::write_u32be(body, versionNumber);
    io::bytecodec::write_u32be(body, fileSize);

    Command cmd(CommandId::RequestFirmwareUpgrade, std::move(body));
    Message resp;
    IOResult r = _session.send(cmd, resp, kUpdateRequestTimeout);
    if (!r.ok()) {
        return Result<UpdateResult>::failure(r);
    }
    if (resp.body.empty()) {
        return Result<UpdateResult>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "empty firmware upgrade reply"));
    }

    UpdateResult res = UpdateResult::Unknown;
    switch (resp.body[0]) {
    case 0x00: res = UpdateResult::Accepted; break;
    case 0x01: res = UpdateResult::WrongVersion; break;
    case 0x02: res = UpdateResult::Busy; break;
    case 0x03: res = UpdateResult::CardFull; break;
    case 0x04: res = UpdateResult::CardError; break;
    default: break;
    }
    HD_LOGI(_log, "firmware upgrade request v=0x%08X size=%u: %s",
            (unsigned)versionNumber, (unsigned)fileSize, to_string(res));
    return Result<UpdateResult>::success(res);
}

io::TransferResult SystemController::upload_firmware(const ByteBuffer& image,
                                                     const ProgressFn& onProgress,
                                                     const std::atomic<bool>* cancel)
{
    return _transfers.upload(CommandId::FirmwareUpload, image, onProgress, cancel, kUpdateDataTimeout);
}

Result<UpdateResult> SystemController::request_update(CommandId id, const ByteBuffer& image)
{
    if (image.size() > std::numeric_limits<std::uint32_t>::max()) {
        return Result<UpdateResult>::failure(
            IOResult::failure(IOStatus::InvalidArgument, "image too large"));
    }

    ByteBuffer body;
    try {
        const crypto::Md5Digest sig = crypto::md5(image.data(), image.size());
        body.assign(sig.begin(), sig.end());
    } catch (const std::runtime_error& ex) {
        HD_LOGE(_log, "signature failed: %s", ex.what());
        return Result<UpdateResult>::failure(IOResult::failure(IOStatus::IOError, ex.what()));
    }
    io::bytecodec::write_u32be(body, static_cast<std::uint32_t>(image.size()));

    Command cmd(id, std::move(body));
    Message resp;
    IOResult r = _session.send(cmd, resp, kUpdateRequestTimeout);
    if (!r.ok()) {
        return Result<UpdateResult>::failure(r);
    }
    if (resp.body.empty()) {
        return Result<UpdateResult>::success(UpdateResult::Unknown);
    }

    switch (resp.body[0]) {
    case 0x00: return Result<UpdateResult>::success(UpdateResult::Accepted);
    case 0x01: return Result<UpdateResult>::success(UpdateResult::LengthMismatch);
    case 0x02: return Result<UpdateResult>::success(UpdateResult::Busy);
    case 0x03: return Result<UpdateResult>::success(UpdateResult::CardFull);
    case 0x04: return Result<UpdateResult>::success(UpdateResult::CardError);
    default:   return Result<UpdateResult>::success(UpdateResult::Unknown);
    }
}

Result<UpdateResult> SystemController::request_tone_update(const ByteBuffer& image)
{
    return request_update(CommandId::RequestToneUpdate, image);
}

IOResult SystemController::update_tone(const ByteBuffer& image)
{
    return checked(CommandId::ToneUpdate, image, kUpdateDataTimeout, "tone update");
}

Result<UpdateResult> SystemController::request_uac_update(const ByteBuffer& image)
{
    return request_update(CommandId::RequestUacUpdate, image);
}

IOResult SystemController::update_uac(const ByteBuffer& image)
{
    return checked(CommandId::UacUpdate, image, kUpdateDataTimeout, "UAC update");
}

} // namespace hidock::device
