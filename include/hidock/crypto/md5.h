#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hidock::crypto {

using Md5Digest = std::array<std::uint8_t, 16>;

// Throws std::runtime_error if the digest backend fails.
Md5Digest md5(const std::uint8_t* data, std::size_t len);

// Lower-case hex of md5(data).
std::string md5_hex(const std::uint8_t* data, std::size_t len);

std::string to_hex(const std::uint8_t* data, std::size_t len);

// Case-insensitive hex comparison.
bool hex_equal(std::string_view a, std::string_view b);

} // namespace hidock::crypto
