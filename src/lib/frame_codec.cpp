#include "hidock/io/protocol/frame_codec.h"
#include "hidock/io/protocol/byte_codec.h"

#include <stdexcept>
#include <string>

namespace hidock::io::protocol {

ByteBuffer encode(const Command& cmd)
{
    if (cmd.body.size() > kMaxBodyLength) {
        throw std::invalid_argument("frame body too large: " + std::to_string(cmd.body.size()));
    }

    ByteBuffer out;
    out.reserve(kFrameHeaderSize + cmd.body.size());

    bytecodec::write_u8(out, kFrameMagic0);
    bytecodec::write_u8(out, kFrameMagic1);
    bytecodec::write_u16be(out, cmd.id);
    bytecodec::write_u32be(out, cmd.sequence);
    bytecodec::write_u8(out, 0); // padding
    bytecodec::write_u24be(out, static_cast<std::uint32_t>(cmd.body.size()));
    out.insert(out.end(), cmd.body.begin(), cmd.body.end());
    return out;
}

DecodeStatus decode(const std::uint8_t* data, std::size_t len,
                    Message& out, std::size_t& consumed)
{
    consumed = 0;

    // Magic is checked as soon as two bytes are visible so a desync is
    // reported instead of waiting forever for a header that never comes.
    if (len >= 2 && (data[0] != kFrameMagic0 || data[1] != kFrameMagic1)) {
        return DecodeStatus::Malformed;
    }
    if (len < kFrameHeaderSize) {
        return DecodeStatus::Incomplete;
    }

    bytecodec::Reader r(data, len);
    std::uint16_t id = 0;
    std::uint32_t seq = 0;
    std::uint8_t padding = 0;
    std::uint32_t bodyLen = 0;

    r.skip(2);
    r.read_u16be(id);
    r.read_u32be(seq);
    r.read_u8(padding);
    r.read_u24be(bodyLen);

    const std::size_t total = kFrameHeaderSize + bodyLen + padding;
    if (len < total) {
        return DecodeStatus::Incomplete;
    }

    const std::uint8_t* body = nullptr;
    r.read_bytes(body, bodyLen);

    out.id = id;
    out.sequence = seq;
    out.body.assign(body, body + bodyLen);
    consumed = total;
    return DecodeStatus::Ok;
}

StreamDecodeResult decode_stream(const std::uint8_t* data, std::size_t len)
{
    StreamDecodeResult result;

    while (result.consumed < len) {
        Message msg;
        std::size_t used = 0;
        const DecodeStatus st = decode(data + result.consumed, len - result.consumed, msg, used);
        if (st != DecodeStatus::Ok) {
            result.stop = st;
            return result;
        }
        result.messages.push_back(std::move(msg));
        result.consumed += used;
    }

    result.stop = DecodeStatus::Incomplete;
    return result;
}

} // namespace hidock::io::protocol
