#include "hidock/device/bcd.h"

#include <cctype>
#include <cstdio>

namespace hidock::device::bcd {

io::protocol::ByteBuffer from_digits(std::string_view digits)
{
    io::protocol::ByteBuffer out;
    if (digits.size() % 2 != 0) {
        return out;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return out;
        }
    }

    out.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        const int hi = digits[i] - '0';
        const int lo = digits[i + 1] - '0';
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string to_digits(const std::uint8_t* data, std::size_t len)
{
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(static_cast<char>('0' + ((data[i] >> 4) & 0x0F)));
        out.push_back(static_cast<char>('0' + (data[i] & 0x0F)));
    }
    return out;
}

std::string format_timestamp(const std::tm& tm)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

} // namespace hidock::device::bcd
