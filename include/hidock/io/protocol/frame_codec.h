#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hidock/io/protocol/frame.h"

namespace hidock::io::protocol {

// Wire layout (all integers big-endian):
//
//   0..1   magic 0x12 0x34
//   2..3   command id
//   4..7   sequence
//   8      padding length
//   9..11  body length (24-bit)
//   12..   body, then `padding` ignored bytes
//
// Decoding works on any (pointer, length) view; offsets are view-relative.

enum class DecodeStatus : std::uint8_t {
    Ok = 0,
    Incomplete,      // not enough bytes yet, not an error
    Malformed,       // first two bytes are not the magic
};

// Encodes header + body with zero padding.
// Throws std::invalid_argument when the body exceeds kMaxBodyLength.
ByteBuffer encode(const Command& cmd);

// Decodes one frame from the start of [data, data+len).
// On Ok, `out` holds the message and `consumed` = 12 + body + padding.
DecodeStatus decode(const std::uint8_t* data, std::size_t len,
                    Message& out, std::size_t& consumed);

inline DecodeStatus decode(const ByteBuffer& buf, Message& out, std::size_t& consumed)
{
    return decode(buf.data(), buf.size(), out, consumed);
}

struct StreamDecodeResult {
    std::vector<Message> messages;
    std::size_t          consumed{0};
    DecodeStatus         stop{DecodeStatus::Incomplete};  // why decoding stopped
};

// Decodes frames back to back until the remainder is incomplete or malformed.
StreamDecodeResult decode_stream(const std::uint8_t* data, std::size_t len);

inline StreamDecodeResult decode_stream(const ByteBuffer& buf)
{
    return decode_stream(buf.data(), buf.size());
}

} // namespace hidock::io::protocol
