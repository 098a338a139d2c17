#pragma once

#include <cstdint>
#include <string>

namespace hidock::device {

enum class RecordingMode : std::uint8_t {
    Room = 0,
    Whisper,
    Call,
};

const char* to_string(RecordingMode m);

struct FileEntry {
    std::string   name;
    std::string   createDate;     // "YYYY/MM/DD" or "YYYY-Mon-DD", empty if unknown
    std::string   createTime;     // "HH:MM:SS", empty if unknown
    double        durationSec{0.0};
    std::uint8_t  version{0};
    std::uint32_t length{0};
    RecordingMode mode{RecordingMode::Room};
    std::string   signature;      // 32 lower-case hex chars
};

struct DeviceSettings {
    bool autoRecord{false};
    bool autoPlay{false};
    bool notification{false};
    bool bluetoothTone{true};
};

enum class CardStatus : std::uint8_t {
    Ok = 0,
    Full,
    Error,
    NoCard,
    Other,
};

struct CardInfo {
    std::uint64_t usedBytes{0};
    std::uint64_t capacityBytes{0};
    CardStatus    status{CardStatus::Ok};
    std::string   statusText;     // "ok", "full", "error", "no_card" or hex
};

enum class BatteryState : std::uint8_t {
    Idle = 0,
    Charging,
    Full,
    Unknown,
};

const char* to_string(BatteryState s);

struct BatteryStatus {
    BatteryState  state{BatteryState::Unknown};
    int           percent{0};
    std::uint32_t voltage{0};
};

enum class BluetoothLinkState : std::uint8_t {
    Disconnected = 0,
    Scanning,
    Connecting,
    Connected,
};

const char* to_string(BluetoothLinkState s);

struct BluetoothStatus {
    BluetoothLinkState state{BluetoothLinkState::Disconnected};
    std::string        name;
    std::string        mac;
    // Profile details are only present when the device reports them.
    bool               hasProfiles{false};
    bool               a2dp{false};
    bool               hfp{false};
    bool               avrcp{false};
    int                batteryPercent{0};
};

struct ScannedDevice {
    std::string   name;
    std::string   mac;
    int           rssi{0};
    std::uint32_t classOfDevice{0};
    bool          audio{false};
};

struct PairedDevice {
    std::string  name;
    std::string  mac;
    std::uint8_t sequence{0};
};

enum class UpdateResult : std::uint8_t {
    Accepted = 0,
    WrongVersion,
    LengthMismatch,
    Busy,
    CardFull,
    CardError,
    Unknown,
};

const char* to_string(UpdateResult r);

} // namespace hidock::device
