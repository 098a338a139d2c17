#include "doctest.h"

#include "mock_transport.h"

#include "hidock/console/console_commands.h"
#include "hidock/console/console_engine.h"
#include "hidock/console/console_parse.h"
#include "hidock/console/device_commands.h"
#include "hidock/device/transfer_engine.h"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace hidock::tests {
namespace {

class FakeConsoleTransport final : public console::IConsoleTransport {
public:
    std::deque<std::uint8_t> in;
    std::string out;

    bool read_byte(std::uint8_t& outb, int /*timeout_ms*/) override
    {
        if (in.empty()) return false;
        outb = in.front();
        in.pop_front();
        return true;
    }

    void write(std::string_view s) override { out.append(s.data(), s.size()); }

    void write_line(std::string_view s) override
    {
        out.append(s.data(), s.size());
        out.push_back('\n');
    }

    void push_line(std::string_view s)
    {
        for (char c : s) in.push_back(static_cast<std::uint8_t>(c));
        in.push_back(static_cast<std::uint8_t>('\r'));
    }
};

static bool contains(std::string_view hay, std::string_view needle)
{
    return hay.find(needle) != std::string_view::npos;
}

struct DeviceConsole {
    MockTransport               transport;
    device::DeviceSession       session{transport, {}, device::SessionOptions{io::Millis(100), io::Millis(50)}};
    device::TransferEngine      transfers{session};
    device::FileController      files{session, transfers};
    device::TimeController      clock{session};
    device::SettingsController  settings{session};
    device::BluetoothController bluetooth{session};
    device::SystemController    system{session, transfers};

    FakeConsoleTransport             io;
    console::DeviceCommandContext    ctx{session, files, clock, settings, bluetooth, system, nullptr, "", {}};
    console::ConsoleCommandRegistry  registry;
    console::ConsoleEngine           engine{registry, io};

    DeviceConsole()
    {
        console::register_device_commands(registry, io, ctx);
    }
};

} // namespace

TEST_CASE("console parse helpers")
{
    const auto argv = console::split_ws("  get   REC01.hda\t100  ");
    REQUIRE(argv.size() == 3);
    CHECK(argv[0] == "get");
    CHECK(argv[1] == "REC01.hda");
    CHECK(argv[2] == "100");
    CHECK(console::split_ws("   ").empty());

    CHECK(console::parse_u64("42") == 42u);
    CHECK(console::parse_u64("0x1F") == 31u);
    CHECK_FALSE(console::parse_u64("12ab").has_value());
    CHECK_FALSE(console::parse_u64("0x").has_value());
    CHECK_FALSE(console::parse_u64("18446744073709551616").has_value());

    CHECK(console::parse_on_off("on") == true);
    CHECK(console::parse_on_off("0") == false);
    CHECK_FALSE(console::parse_on_off("maybe").has_value());
}

TEST_CASE("ConsoleCommandRegistry: dispatch and help")
{
    console::ConsoleCommandRegistry reg;
    int calls = 0;
    CHECK(reg.register_command({"zeta", "last one", ""}, [&](const auto&) { ++calls; return true; }));
    CHECK(reg.register_command({"alpha", "first one", "alpha <x>"}, [](const auto&) { return false; }));
    CHECK_FALSE(reg.register_command({"zeta", "dup", ""}, [](const auto&) { return true; }));

    CHECK(reg.dispatch({"zeta"}) == true);
    CHECK(calls == 1);
    CHECK(reg.dispatch({"alpha", "1"}) == false);
    CHECK_FALSE(reg.dispatch({"nope"}).has_value());

    FakeConsoleTransport io;
    reg.print_help(io);
    CHECK(contains(io.out, "alpha <x> - first one"));
    CHECK(io.out.find("alpha") < io.out.find("zeta"));
}

TEST_CASE("ConsoleEngine: line editing, history and unknown commands")
{
    console::ConsoleCommandRegistry reg;
    std::vector<std::string> seen;
    reg.register_command({"echo", "", ""}, [&](const std::vector<std::string_view>& argv) {
        seen.emplace_back(argv.size() > 1 ? argv[1] : "");
        return true;
    });

    FakeConsoleTransport io;
    console::ConsoleEngine engine(reg, io);

    SUBCASE("unknown command")
    {
        io.push_line("bogus 1 2");
        CHECK(engine.step(0));
        CHECK(contains(io.out, "unknown command: bogus"));
    }

    SUBCASE("backspace and kill line")
    {
        io.push_line("junk\x15" "echo abx\x7f" "c");
        CHECK(engine.step(0));
        REQUIRE(seen.size() == 1);
        CHECK(seen[0] == "abc");
    }

    SUBCASE("up arrow recalls the previous line")
    {
        io.push_line("echo first");
        CHECK(engine.step(0));
        io.push_line("\x1b[A");
        CHECK(engine.step(0));
        REQUIRE(seen.size() == 2);
        CHECK(seen[1] == "first");
    }

    SUBCASE("no input keeps running")
    {
        CHECK(engine.step(0));
        CHECK(seen.empty());
    }
}

TEST_CASE("device commands: not connected")
{
    DeviceConsole con;
    CHECK(con.engine.handle_line("info"));
    CHECK(contains(con.io.out, "error: "));
    CHECK_FALSE(con.engine.handle_line("quit"));
}

TEST_CASE("device commands against a scripted recorder")
{
    DeviceConsole con;
    REQUIRE(con.session.connect().ok());

    SUBCASE("info")
    {
        CHECK(con.engine.handle_line("info"));
        CHECK(contains(con.io.out, "hidock-p1"));
        CHECK(contains(con.io.out, "HD1234567890"));
        CHECK(contains(con.io.out, "6.1.2"));
    }

    SUBCASE("count")
    {
        con.transport.on(CommandId::QueryFileCount, [](const Message& m, MockTransport& t) {
            t.reply(m, {0, 0, 0, 7});
        });
        CHECK(con.engine.handle_line("count"));
        CHECK(contains(con.io.out, "7\n"));
    }

    SUBCASE("set writes one settings slot")
    {
        con.transport.on(CommandId::SetSettings, [](const Message& m, MockTransport& t) {
            t.reply(m, {0});
        });
        CHECK(con.engine.handle_line("set auto-record on"));
        CHECK(contains(con.io.out, "ok"));

        const auto writes = con.transport.sent_with(CommandId::SetSettings);
        REQUIRE(writes.size() == 1);
        REQUIRE(writes[0].body.size() == 4);
        CHECK(writes[0].body[3] == 1);
    }

    SUBCASE("bad arguments print usage")
    {
        CHECK(con.engine.handle_line("set auto-record sometimes"));
        CHECK(contains(con.io.out, "usage: set <key> on|off"));
        CHECK(con.engine.handle_line("get onlyname"));
        CHECK(contains(con.io.out, "usage: get <name> <size> <out>"));
        CHECK(con.transport.sent_with(CommandId::SetSettings).empty());
    }

    SUBCASE("devices without discovery")
    {
        CHECK(con.engine.handle_line("devices"));
        CHECK(contains(con.io.out, "device discovery not available"));
    }

    SUBCASE("fw-check without a catalogue")
    {
        CHECK(con.engine.handle_line("fw-check"));
        CHECK(contains(con.io.out, "firmware service not configured"));
    }
}

} // namespace hidock::tests
