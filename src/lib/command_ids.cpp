#include "hidock/io/protocol/command_ids.h"

#include <string_view>

namespace hidock::io::protocol {

const char* command_name(std::uint16_t raw)
{
    switch (static_cast<CommandId>(raw)) {
    case CommandId::Invalid:                return "invalid";
    case CommandId::QueryDeviceInfo:        return "query-device-info";
    case CommandId::QueryDeviceTime:        return "query-device-time";
    case CommandId::SetDeviceTime:          return "set-device-time";
    case CommandId::QueryFileList:          return "query-file-list";
    case CommandId::TransferFile:           return "transfer-file";
    case CommandId::QueryFileCount:         return "query-file-count";
    case CommandId::DeleteFile:             return "delete-file";
    case CommandId::RequestFirmwareUpgrade: return "request-firmware-upgrade";
    case CommandId::FirmwareUpload:         return "firmware-upload";
    case CommandId::DeviceMsgTest:          return "device-msg-test";
    case CommandId::GetSettings:            return "get-settings";
    case CommandId::SetSettings:            return "set-settings";
    case CommandId::GetFileBlock:           return "get-file-block";
    case CommandId::ReadCardInfo:           return "read-card-info";
    case CommandId::FormatCard:             return "format-card";
    case CommandId::GetRecordingFile:       return "get-recording-file";
    case CommandId::RestoreFactorySettings: return "restore-factory-settings";
    case CommandId::ScheduleInfo:           return "schedule-info";
    case CommandId::TransferFilePartial:    return "transfer-file-partial";
    case CommandId::RequestToneUpdate:      return "request-tone-update";
    case CommandId::ToneUpdate:             return "tone-update";
    case CommandId::RequestUacUpdate:       return "request-uac-update";
    case CommandId::UacUpdate:              return "uac-update";
    case CommandId::SendKeyCode:            return "send-key-code";
    case CommandId::RealtimeReadSetting:    return "realtime-read-setting";
    case CommandId::RealtimeControl:        return "realtime-control";
    case CommandId::RealtimeTransfer:       return "realtime-transfer";
    case CommandId::BluetoothScan:          return "bluetooth-scan";
    case CommandId::BluetoothCmd:           return "bluetooth-cmd";
    case CommandId::BluetoothStatus:        return "bluetooth-status";
    case CommandId::GetBatteryStatus:       return "get-battery-status";
    case CommandId::BtScan:                 return "bt-scan";
    case CommandId::BtDevList:              return "bt-dev-list";
    case CommandId::BtGetPairedDevList:     return "bt-get-paired-dev-list";
    case CommandId::BtRemovePairedDev:      return "bt-remove-paired-dev";
    case CommandId::TestSnWrite:            return "test-sn-write";
    case CommandId::RecordTestStart:        return "record-test-start";
    case CommandId::RecordTestEnd:          return "record-test-end";
    case CommandId::FactoryReset:           return "factory-reset";
    case CommandId::EnterMassStorage:       return "enter-mass-storage";
    case CommandId::WriteWebusbTimeout:     return "write-webusb-timeout";
    case CommandId::ReadWebusbTimeout:      return "read-webusb-timeout";
    }
    return "unknown";
}

bool is_known_command(std::uint16_t raw)
{
    return raw != 0 && std::string_view(command_name(raw)) != "unknown";
}

} // namespace hidock::io::protocol
