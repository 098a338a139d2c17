#include "hidock/device/device_model.h"

namespace hidock::device {

DeviceModel model_from_product_id(std::uint16_t productId)
{
    switch (productId) {
    case 0xB00C:
    case 0x0100:
    case 0x0102:
        return DeviceModel::H1;
    case 0xB00D:
    case 0x0101:
    case 0x0103:
        return DeviceModel::H1E;
    case 0xB00E:
    case 0x2040:
        return DeviceModel::P1;
    case 0xB00F:
    case 0x2041:
        return DeviceModel::P1Mini;
    default:
        return DeviceModel::Unknown;
    }
}

const char* model_name(DeviceModel model)
{
    switch (model) {
    case DeviceModel::H1:      return "hidock-h1";
    case DeviceModel::H1E:     return "hidock-h1e";
    case DeviceModel::P1:      return "hidock-p1";
    case DeviceModel::P1Mini:  return "hidock-p1:mini";
    case DeviceModel::Unknown: break;
    }
    return "unknown";
}

} // namespace hidock::device
