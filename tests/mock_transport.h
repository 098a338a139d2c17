#pragma once

#include "hidock/io/protocol/frame_codec.h"
#include "hidock/io/transport/transport.h"

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hidock::tests {

using io::IOResult;
using io::IOStatus;
using io::protocol::ByteBuffer;
using io::protocol::CommandId;
using io::protocol::Message;

inline ByteBuffer make_frame(std::uint16_t id, std::uint32_t seq, const ByteBuffer& body)
{
    io::protocol::Command c;
    c.id = id;
    c.sequence = seq;
    c.body = body;
    return io::protocol::encode(c);
}

inline ByteBuffer make_frame(CommandId id, std::uint32_t seq, const ByteBuffer& body)
{
    return make_frame(io::protocol::to_raw(id), seq, body);
}

// Device-info body: version (BE) then a zero-padded 16-byte serial.
inline ByteBuffer device_info_body(std::uint32_t version, const std::string& serial)
{
    ByteBuffer b{
        static_cast<std::uint8_t>(version >> 24),
        static_cast<std::uint8_t>(version >> 16),
        static_cast<std::uint8_t>(version >> 8),
        static_cast<std::uint8_t>(version),
    };
    b.insert(b.end(), serial.begin(), serial.end());
    b.resize(20, 0);
    return b;
}

// Scripted in-memory device.
//
// Inbound chunks are returned one per receive(). With nothing queued,
// receive() waits the full timeout and reports Timeout. Handlers
// registered with on() run synchronously inside send() and usually queue
// a reply. Device-info requests are answered automatically from infoBody.
class MockTransport final : public io::ITransport {
public:
    using Handler = std::function<void(const Message& sent, MockTransport& self)>;

    device::DeviceModel deviceModel{device::DeviceModel::P1};
    ByteBuffer          infoBody{device_info_body(0x00060102, "HD1234567890")};
    bool                autoAnswerInfo{true};
    bool                failConnect{false};
    std::optional<IOResult> receiveError;   // reported by the next receive()
    io::Millis          chunkDelay{0};      // wait before handing out each queued chunk

    std::deque<ByteBuffer> inbound;
    std::vector<Message>   sent;
    int connectCalls{0};
    int disconnectCalls{0};

    void on(CommandId id, Handler h) { _handlers[io::protocol::to_raw(id)] = std::move(h); }

    void push_raw(ByteBuffer bytes) { inbound.push_back(std::move(bytes)); }

    void push_frame(std::uint16_t id, std::uint32_t seq, const ByteBuffer& body)
    {
        inbound.push_back(make_frame(id, seq, body));
    }

    // Queues a response correlated with `to`.
    void reply(const Message& to, const ByteBuffer& body) { push_frame(to.id, to.sequence, body); }

    std::vector<Message> sent_with(CommandId id) const
    {
        std::vector<Message> out;
        for (const auto& m : sent) {
            if (m.id == io::protocol::to_raw(id)) out.push_back(m);
        }
        return out;
    }

    IOResult connect() override
    {
        ++connectCalls;
        if (failConnect) {
            return IOResult::failure(IOStatus::ConnectionFailed, "mock: no device");
        }
        _connected = true;
        return IOResult::success();
    }

    void disconnect() override
    {
        ++disconnectCalls;
        _connected = false;
    }

    IOResult send(const ByteBuffer& bytes) override
    {
        if (!_connected) {
            return IOResult::failure(IOStatus::NotConnected);
        }
        Message msg;
        std::size_t used = 0;
        if (io::protocol::decode(bytes, msg, used) != io::protocol::DecodeStatus::Ok) {
            return IOResult::failure(IOStatus::IOError, "mock: unparseable frame");
        }
        sent.push_back(msg);

        auto it = _handlers.find(msg.id);
        if (it != _handlers.end()) {
            it->second(msg, *this);
        } else if (autoAnswerInfo && msg.id == io::protocol::to_raw(CommandId::QueryDeviceInfo)) {
            reply(msg, infoBody);
        }
        return IOResult::success();
    }

    IOResult receive(ByteBuffer& out, io::Millis timeout) override
    {
        out.clear();
        if (receiveError) {
            IOResult e = *receiveError;
            receiveError.reset();
            return e;
        }
        if (inbound.empty()) {
            std::this_thread::sleep_for(timeout);
            return IOResult::failure(IOStatus::Timeout);
        }
        if (chunkDelay.count() > 0) {
            std::this_thread::sleep_for(chunkDelay);
        }
        out = std::move(inbound.front());
        inbound.pop_front();
        return IOResult::success();
    }

    bool is_connected() const override { return _connected; }

    device::DeviceModel model() const override { return deviceModel; }

private:
    bool _connected{false};
    std::map<std::uint16_t, Handler> _handlers;
};

} // namespace hidock::tests
