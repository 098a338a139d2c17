#pragma once

#include <chrono>
#include <cstdint>

#include "hidock/device/device_model.h"
#include "hidock/io/io_status.h"
#include "hidock/io/protocol/frame.h"

namespace hidock::io {

using Millis = std::chrono::milliseconds;

// Byte pipe to one recorder. Framing lives above this layer.
class ITransport {
public:
    virtual ~ITransport() = default;

    // Opens and claims the device. ConnectionFailed when absent or busy.
    virtual IOResult connect() = 0;

    // Safe to call repeatedly.
    virtual void disconnect() = 0;

    // Writes raw frame bytes. NotConnected when closed.
    virtual IOResult send(const protocol::ByteBuffer& bytes) = 0;

    // Blocks up to `timeout` for the next chunk of inbound bytes and
    // replaces `out` with it. Timeout when nothing arrived.
    virtual IOResult receive(protocol::ByteBuffer& out, Millis timeout) = 0;

    virtual bool is_connected() const = 0;

    virtual device::DeviceModel model() const = 0;
};

} // namespace hidock::io
