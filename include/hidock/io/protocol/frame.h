#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "hidock/io/protocol/command_ids.h"

namespace hidock::io::protocol {

using ByteBuffer = std::vector<std::uint8_t>;

inline constexpr std::uint8_t  kFrameMagic0      = 0x12;
inline constexpr std::uint8_t  kFrameMagic1      = 0x34;
inline constexpr std::size_t   kFrameHeaderSize  = 12;
inline constexpr std::uint32_t kMaxBodyLength    = 0xFFFFFF;

// Outbound request. `sequence` is assigned by the session just before send.
struct Command {
    std::uint16_t id{0};
    std::uint32_t sequence{0};
    ByteBuffer    body;

    Command() = default;
    Command(CommandId cid, ByteBuffer b = {})
        : id(to_raw(cid)), body(std::move(b)) {}
};

// Inbound frame decoded from the device.
struct Message {
    std::uint16_t id{0};
    std::uint32_t sequence{0};
    ByteBuffer    body;
};

} // namespace hidock::io::protocol
