#include "hidock/device/device_info.h"
#include "hidock/io/protocol/byte_codec.h"

#include <algorithm>

namespace hidock::device {

bool parse_device_info(const io::protocol::ByteBuffer& body, DeviceInfo& out)
{
    io::bytecodec::Reader r(body);
    std::uint32_t version = 0;
    if (!r.read_u32be(version)) {
        return false;
    }

    out.versionNumber = version;
    out.versionCode = std::to_string(body[1]) + "." +
                      std::to_string(body[2]) + "." +
                      std::to_string(body[3]);

    out.serialNumber.clear();
    const std::size_t snEnd = std::min<std::size_t>(20, body.size());
    for (std::size_t i = 4; i < snEnd; ++i) {
        if (body[i] != 0) {
            out.serialNumber.push_back(static_cast<char>(body[i]));
        }
    }
    return true;
}

} // namespace hidock::device
