#pragma once

#include <cstdint>

namespace hidock::device {

enum class DeviceModel : std::uint8_t {
    Unknown = 0,
    H1,
    H1E,
    P1,
    P1Mini,
};

inline constexpr std::uint16_t kVendorIdPrimary   = 0x10D6;
inline constexpr std::uint16_t kVendorIdSecondary = 0x3887;

// Maps a USB product id onto a known recorder model.
DeviceModel model_from_product_id(std::uint16_t productId);

// "hidock-h1", "hidock-h1e", "hidock-p1", "hidock-p1:mini", "unknown".
const char* model_name(DeviceModel model);

inline bool is_p1_family(DeviceModel m) noexcept
{
    return m == DeviceModel::P1 || m == DeviceModel::P1Mini;
}

inline bool is_h1_family(DeviceModel m) noexcept
{
    return m == DeviceModel::H1 || m == DeviceModel::H1E;
}

} // namespace hidock::device
