#include "hidock/device/device_types.h"

namespace hidock::device {

const char* to_string(RecordingMode m)
{
    switch (m) {
    case RecordingMode::Room:    return "room";
    case RecordingMode::Whisper: return "whisper";
    case RecordingMode::Call:    return "call";
    }
    return "room";
}

const char* to_string(BatteryState s)
{
    switch (s) {
    case BatteryState::Idle:     return "idle";
    case BatteryState::Charging: return "charging";
    case BatteryState::Full:     return "full";
    case BatteryState::Unknown:  break;
    }
    return "unknown";
}

const char* to_string(BluetoothLinkState s)
{
    switch (s) {
    case BluetoothLinkState::Disconnected: return "disconnected";
    case BluetoothLinkState::Scanning:     return "scanning";
    case BluetoothLinkState::Connecting:   return "connecting";
    case BluetoothLinkState::Connected:    return "connected";
    }
    return "disconnected";
}

const char* to_string(UpdateResult r)
{
    switch (r) {
    case UpdateResult::Accepted:       return "accepted";
    case UpdateResult::WrongVersion:   return "wrong-version";
    case UpdateResult::LengthMismatch: return "length-mismatch";
    case UpdateResult::Busy:           return "busy";
    case UpdateResult::CardFull:       return "card-full";
    case UpdateResult::CardError:      return "card-error";
    case UpdateResult::Unknown:        break;
    }
    return "unknown";
}

} // namespace hidock::device
