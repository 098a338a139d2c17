#include "hidock/io/transport/safe_transport.h"
#include "hidock/io/protocol/command_ids.h"
#include "hidock/io/protocol/frame_codec.h"

namespace hidock::io {

using protocol::CommandId;

bool SafeTransport::is_allowed(std::uint16_t commandId)
{
    switch (static_cast<CommandId>(commandId)) {
    case CommandId::QueryDeviceInfo:
    case CommandId::QueryDeviceTime:
    case CommandId::QueryFileList:
    case CommandId::QueryFileCount:
    case CommandId::TransferFile:
    case CommandId::GetFileBlock:
    case CommandId::GetRecordingFile:
    case CommandId::ScheduleInfo:
    case CommandId::TransferFilePartial:
    case CommandId::GetSettings:
    case CommandId::GetBatteryStatus:
    case CommandId::ReadCardInfo:
    case CommandId::ReadWebusbTimeout:
    case CommandId::BluetoothStatus:
    case CommandId::BtDevList:
    case CommandId::BtGetPairedDevList:
    case CommandId::BtScan:
        return true;
    default:
        return false;
    }
}

IOResult SafeTransport::send(const protocol::ByteBuffer& bytes)
{
    protocol::Message msg;
    std::size_t used = 0;
    if (protocol::decode(bytes, msg, used) != protocol::DecodeStatus::Ok) {
        HD_LOGW(_log, "blocked unparseable outbound frame (%zu bytes)", bytes.size());
        return IOResult::failure(IOStatus::Blocked, "unparseable frame");
    }

    if (!is_allowed(msg.id)) {
        HD_LOGW(_log, "blocked %s (id=%u)",
                protocol::command_name(msg.id), (unsigned)msg.id);
        return IOResult::failure(IOStatus::Blocked,
                                 std::string("command not allowed in safe mode: ")
                                     + protocol::command_name(msg.id));
    }

    return _inner.send(bytes);
}

} // namespace hidock::io
