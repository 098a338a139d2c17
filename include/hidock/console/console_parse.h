#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace hidock::console {

std::string_view trim_ws(std::string_view s);

// Split on ASCII whitespace, after trimming ends.
std::vector<std::string_view> split_ws(std::string_view s);

// Decimal, or hex with a 0x prefix. nullopt on junk or overflow.
std::optional<std::uint64_t> parse_u64(std::string_view s);

// "on"/"off", "true"/"false", "1"/"0".
std::optional<bool> parse_on_off(std::string_view s);

} // namespace hidock::console
