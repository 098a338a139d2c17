#pragma once

#include <cstdint>

namespace hidock::io::protocol {

enum class CommandId : std::uint16_t {
    Invalid                 = 0,
    QueryDeviceInfo         = 1,
    QueryDeviceTime         = 2,
    SetDeviceTime           = 3,
    QueryFileList           = 4,
    TransferFile            = 5,
    QueryFileCount          = 6,
    DeleteFile              = 7,
    RequestFirmwareUpgrade  = 8,
    FirmwareUpload          = 9,
    DeviceMsgTest           = 10,
    GetSettings             = 11,
    SetSettings             = 12,
    GetFileBlock            = 13,
    ReadCardInfo            = 16,
    FormatCard              = 17,
    GetRecordingFile        = 18,
    RestoreFactorySettings  = 19,
    ScheduleInfo            = 20,
    TransferFilePartial     = 21,
    RequestToneUpdate       = 22,
    ToneUpdate              = 23,
    RequestUacUpdate        = 24,
    UacUpdate               = 25,
    SendKeyCode             = 28,
    RealtimeReadSetting     = 32,
    RealtimeControl         = 33,
    RealtimeTransfer        = 34,

    // P1 family
    BluetoothScan           = 0x1001,
    BluetoothCmd            = 0x1002,
    BluetoothStatus         = 0x1003,
    GetBatteryStatus        = 0x1004,
    BtScan                  = 0x1005,
    BtDevList               = 0x1006,
    BtGetPairedDevList      = 0x1007,
    BtRemovePairedDev       = 0x1008,

    // factory / test
    TestSnWrite             = 0xF007,
    RecordTestStart         = 0xF008,
    RecordTestEnd           = 0xF009,
    FactoryReset            = 0xF00B,
    EnterMassStorage        = 0xF00F,
    WriteWebusbTimeout      = 0xF010,
    ReadWebusbTimeout       = 0xF011,
};

constexpr std::uint16_t to_raw(CommandId id) noexcept
{
    return static_cast<std::uint16_t>(id);
}

// Returns false for raw values that are not a known command.
bool is_known_command(std::uint16_t raw);

// Kebab-case name for logging; "unknown" for unrecognised ids.
const char* command_name(std::uint16_t raw);

inline const char* command_name(CommandId id)
{
    return command_name(to_raw(id));
}

} // namespace hidock::io::protocol
