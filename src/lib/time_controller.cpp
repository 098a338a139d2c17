#include "hidock/device/time_controller.h"
#include "hidock/device/bcd.h"
#include "hidock/io/protocol/command_ids.h"

namespace hidock::device {

using io::IOResult;
using io::IOStatus;
using io::protocol::Command;
using io::protocol::CommandId;
using io::protocol::Message;

io::Result<std::string> TimeController::get()
{
    Command cmd(CommandId::QueryDeviceTime);
    Message resp;
    IOResult r = _session.send(cmd, resp);
    if (!r.ok()) {
        return io::Result<std::string>::failure(r);
    }
    if (resp.body.size() < 7) {
        return io::Result<std::string>::failure(
            IOResult::failure(IOStatus::InvalidResponse, "device time body too short"));
    }

    const std::string d = bcd::to_digits(resp.body.data(), 7);
    if (d == "00000000000000") {
        return io::Result<std::string>::success("unknown");
    }

    return io::Result<std::string>::success(
        d.substr(0, 4) + "-" + d.substr(4, 2) + "-" + d.substr(6, 2) + " " +
        d.substr(8, 2) + ":" + d.substr(10, 2) + ":" + d.substr(12, 2));
}

IOResult TimeController::set(const std::tm& localTime)
{
    const auto body = bcd::from_digits(bcd::format_timestamp(localTime));
    if (body.size() != 7) {
        return IOResult::failure(IOStatus::InvalidArgument, "time out of range");
    }

    Command cmd(CommandId::SetDeviceTime, body);
    Message resp;
    return _session.send(cmd, resp);
}

IOResult TimeController::sync_now()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    if (::localtime_r(&now, &local) == nullptr) {
        return IOResult::failure(IOStatus::IOError, "localtime_r failed");
    }
    return set(local);
}

} // namespace hidock::device
