#pragma once

#include <cstdint>

#include "hidock/core/logging.h"
#include "hidock/io/transport/transport.h"

namespace hidock::io {

// Read-only guard around another transport.
//
// Outbound frames whose command id is not on the read-only list are
// rejected with Blocked and never reach the device. Frames that cannot
// be parsed are blocked as well.
class SafeTransport final : public ITransport {
public:
    SafeTransport(ITransport& inner, log::Logger logger = {})
        : _inner(inner)
        , _log(logger.with_tag("safe"))
    {}

    static bool is_allowed(std::uint16_t commandId);

    IOResult connect() override { return _inner.connect(); }
    void disconnect() override { _inner.disconnect(); }
    IOResult send(const protocol::ByteBuffer& bytes) override;
    IOResult receive(protocol::ByteBuffer& out, Millis timeout) override
    {
        return _inner.receive(out, timeout);
    }
    bool is_connected() const override { return _inner.is_connected(); }
    device::DeviceModel model() const override { return _inner.model(); }

private:
    ITransport& _inner;
    log::Logger _log;
};

} // namespace hidock::io
