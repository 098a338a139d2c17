#pragma once

#include <cstdint>

#include "hidock/device/device_model.h"

namespace hidock::device {

// Feature gates by model and firmware version number.
struct Capabilities {
    DeviceModel   model{DeviceModel::Unknown};
    std::uint32_t version{0};

    bool battery_status() const noexcept { return is_p1_family(model); }
    bool bluetooth() const noexcept { return is_p1_family(model); }

    bool card_info() const noexcept
    {
        return !(is_h1_family(model) && version < 0x00050025);
    }

    bool auto_record_settings() const noexcept
    {
        return !(is_h1_family(model) && version < 0x00050012);
    }

    bool factory_reset() const noexcept
    {
        return !(is_h1_family(model) && version < 0x00050009);
    }

    bool restore_factory() const noexcept
    {
        if (model == DeviceModel::H1 && version < 0x00050048) return false;
        if (model == DeviceModel::H1E && version < 0x00060004) return false;
        return true;
    }

    // Older firmware does not announce the list size, so the count is asked first.
    bool file_list_needs_count() const noexcept { return version <= 0x0005001A; }
};

} // namespace hidock::device
