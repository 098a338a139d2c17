#pragma once

#include <ctime>
#include <string>
#include <string_view>

#include "hidock/io/protocol/frame.h"

namespace hidock::device::bcd {

// "20250102030405" -> {0x20,0x25,0x01,0x02,0x03,0x04,0x05}.
// Returns an empty buffer when the text is not an even run of digits.
io::protocol::ByteBuffer from_digits(std::string_view digits);

// Packed BCD back to digits, two per byte.
std::string to_digits(const std::uint8_t* data, std::size_t len);

// Formats local broken-down time as "YYYYMMDDHHMMSS".
std::string format_timestamp(const std::tm& tm);

} // namespace hidock::device::bcd
