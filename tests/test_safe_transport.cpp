#include "doctest.h"

#include "capture_log_sink.h"
#include "mock_transport.h"

#include "hidock/device/device_session.h"
#include "hidock/io/transport/safe_transport.h"

using namespace hidock;
using namespace hidock::tests;

TEST_CASE("SafeTransport: read-only commands pass through")
{
    MockTransport inner;
    io::SafeTransport safe(inner);
    REQUIRE(safe.connect().ok());

    CHECK(safe.send(make_frame(CommandId::QueryFileList, 1, {})).ok());
    CHECK(safe.send(make_frame(CommandId::TransferFile, 2, {'a'})).ok());
    CHECK(safe.send(make_frame(CommandId::BtScan, 3, {1, 30})).ok());
    CHECK(inner.sent.size() == 3);
}

TEST_CASE("SafeTransport: mutating and unknown commands are blocked")
{
    CaptureLogSink sink;
    MockTransport inner;
    io::SafeTransport safe(inner, sink.logger());
    REQUIRE(safe.connect().ok());

    CHECK(safe.send(make_frame(CommandId::DeleteFile, 1, {'a'})).status == IOStatus::Blocked);
    CHECK(safe.send(make_frame(CommandId::FormatCard, 2, {1, 2, 3, 4})).status == IOStatus::Blocked);
    CHECK(safe.send(make_frame(CommandId::SetDeviceTime, 3, {})).status == IOStatus::Blocked);
    CHECK(safe.send(make_frame(std::uint16_t{0x7777}, 4, {})).status == IOStatus::Blocked);
    CHECK(safe.send({0x01, 0x02, 0x03}).status == IOStatus::Blocked);

    CHECK(inner.sent.empty());
    CHECK(sink.contains(log::Level::Warn, "blocked"));
}

TEST_CASE("SafeTransport: a session on top still handshakes")
{
    MockTransport inner;
    io::SafeTransport safe(inner);
    device::DeviceSession session(safe, {}, device::SessionOptions{io::Millis(100), io::Millis(50)});

    REQUIRE(session.connect().ok());
    CHECK(session.serial_number() == "HD1234567890");

    io::protocol::Command del(CommandId::DeleteFile, {'x'});
    Message resp;
    CHECK(session.send(del, resp).status == IOStatus::Blocked);
}
