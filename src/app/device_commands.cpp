#include "hidock/console/device_commands.h"

#include "hidock/console/console_parse.h"
#include "hidock/device/device_model.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <string>

namespace hidock::console {

using device::DeviceSettings;
using io::IOResult;

namespace {

std::string fmt(const char* f, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

std::string fmt(const char* f, ...)
{
    char buf[512];
    va_list args;
    va_start(args, f);
    const int n = std::vsnprintf(buf, sizeof(buf), f, args);
    va_end(args);
    if (n < 0) {
        return {};
    }
    return std::string(buf, static_cast<std::size_t>(n) < sizeof(buf) ? static_cast<std::size_t>(n) : sizeof(buf) - 1);
}

void print_error(IConsoleTransport& io, const IOResult& r)
{
    std::string line = "error: ";
    line += io::to_string(r.status);
    if (!r.message.empty()) {
        line += " (";
        line += r.message;
        line += ")";
    }
    io.write_line(line);
}

void print_usage(IConsoleTransport& io, const ConsoleCommandRegistry& registry, std::string_view name)
{
    if (const auto* spec = registry.find(name)) {
        io.write("usage: ");
        io.write_line(spec->usage.empty() ? spec->name : spec->usage);
    }
}

const char* on_off(bool v)
{
    return v ? "on" : "off";
}

std::string human_size(std::uint64_t bytes)
{
    if (bytes >= 1024ull * 1024ull * 1024ull) {
        return fmt("%.1f GiB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    }
    if (bytes >= 1024ull * 1024ull) {
        return fmt("%.1f MiB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    if (bytes >= 1024ull) {
        return fmt("%.1f KiB", static_cast<double>(bytes) / 1024.0);
    }
    return fmt("%llu B", static_cast<unsigned long long>(bytes));
}

} // namespace

void register_device_commands(ConsoleCommandRegistry& registry,
                              IConsoleTransport& io,
                              DeviceCommandContext& ctx)
{
    ConsoleCommandRegistry* reg = &registry;
    IConsoleTransport* out = &io;
    DeviceCommandContext* c = &ctx;

    registry.register_command({"help", "list commands", "help"},
        [reg, out](const auto&) {
            reg->print_help(*out);
            return true;
        });

    registry.register_command({"quit", "leave the console", "quit"},
        [](const auto&) { return false; });

    // ---------- identity ----------

    registry.register_command({"info", "device model, firmware and serial", "info"},
        [out, c](const auto&) {
            if (!c->session.is_connected()) {
                print_error(*out, IOResult::failure(io::IOStatus::NotConnected));
                return true;
            }
            const auto info = c->session.info();
            out->write_line(fmt("model:    %s", device::model_name(info.model)));
            out->write_line(fmt("firmware: %s (%u)", info.versionCode.c_str(), (unsigned)info.versionNumber));
            out->write_line(fmt("serial:   %s", info.serialNumber.c_str()));
            out->write_line(fmt("session:  %s, next seq %u",
                                device::to_string(c->session.state()),
                                (unsigned)c->session.next_sequence()));
            return true;
        });

    registry.register_command({"devices", "list attached recorders", "devices"},
        [out, c](const auto&) {
            if (!c->listDevices) {
                out->write_line("device discovery not available");
                return true;
            }
            const auto lines = c->listDevices();
            if (lines.empty()) {
                out->write_line("no HiDock devices found");
            }
            for (const auto& l : lines) {
                out->write_line(l);
            }
            return true;
        });

    // ---------- clock ----------

    registry.register_command({"time", "read the device clock", "time"},
        [out, c](const auto&) {
            auto r = c->clock.get();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            out->write_line(r.value);
            return true;
        });

    registry.register_command({"time-sync", "set the device clock to local time", "time-sync"},
        [out, c](const auto&) {
            const IOResult r = c->clock.sync_now();
            if (!r.ok()) {
                print_error(*out, r);
                return true;
            }
            out->write_line("ok");
            return true;
        });

    // ---------- files ----------

    registry.register_command({"count", "number of recordings", "count"},
        [out, c](const auto&) {
            auto r = c->files.count();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            out->write_line(fmt("%u", (unsigned)r.value));
            return true;
        });

    registry.register_command({"ls", "list recordings", "ls"},
        [out, c](const auto&) {
            auto r = c->files.list();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            for (const auto& f : r.value) {
                out->write_line(fmt("%-40s %10u  %s %s  %7.1fs  %s",
                                    f.name.c_str(),
                                    (unsigned)f.length,
                                    f.createDate.c_str(),
                                    f.createTime.c_str(),
                                    f.durationSec,
                                    device::to_string(f.mode)));
            }
            out->write_line(fmt("%zu file(s)", r.value.size()));
            return true;
        });

    registry.register_command({"get", "download a recording", "get <name> <size> <out>"},
        [reg, out, c](const std::vector<std::string_view>& argv) {
            if (argv.size() != 4) {
                print_usage(*out, *reg, "get");
                return true;
            }
            const auto size = parse_u64(argv[2]);
            if (!size) {
                out->write_line("size must be a number");
                return true;
            }

            io::protocol::ByteBuffer data;
            std::size_t lastPct = 101;
            auto progress = [out, &lastPct](std::size_t got, std::size_t total) {
                const std::size_t pct = total ? (got * 100) / total : 100;
                if (pct != lastPct) {
                    lastPct = pct;
                    out->write(fmt("\r%zu%% (%zu/%zu)", pct, got, total));
                }
            };

            const auto r = c->files.download(std::string(argv[1]),
                                             static_cast<std::size_t>(*size),
                                             data, progress);
            out->write_line("");
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }

            const std::string path(argv[3]);
            std::ofstream f(path, std::ios::binary | std::ios::trunc);
            if (!f) {
                out->write_line("cannot open " + path);
                return true;
            }
            f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!f) {
                out->write_line("write failed: " + path);
                return true;
            }
            out->write_line(fmt("saved %zu bytes to %s", data.size(), path.c_str()));
            return true;
        });

    registry.register_command({"rm", "delete a recording", "rm <name>"},
        [reg, out, c](const std::vector<std::string_view>& argv) {
            if (argv.size() != 2) {
                print_usage(*out, *reg, "rm");
                return true;
            }
            const IOResult r = c->files.remove(std::string(argv[1]));
            if (!r.ok()) {
                print_error(*out, r);
                return true;
            }
            out->write_line("deleted");
            return true;
        });

    // ---------- settings ----------

    registry.register_command({"settings", "show device settings", "settings"},
        [out, c](const auto&) {
            auto r = c->settings.get();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            const DeviceSettings& s = r.value;
            out->write_line(fmt("auto-record:    %s", on_off(s.autoRecord)));
            out->write_line(fmt("auto-play:      %s", on_off(s.autoPlay)));
            out->write_line(fmt("notification:   %s", on_off(s.notification)));
            out->write_line(fmt("bluetooth-tone: %s", on_off(s.bluetoothTone)));
            return true;
        });

    registry.register_command({"set", "change a setting (auto-record, auto-play, notification, bluetooth-tone)",
                               "set <key> on|off"},
        [reg, out, c](const std::vector<std::string_view>& argv) {
            if (argv.size() != 3) {
                print_usage(*out, *reg, "set");
                return true;
            }
            const auto value = parse_on_off(argv[2]);
            if (!value) {
                print_usage(*out, *reg, "set");
                return true;
            }

            IOResult r;
            const std::string_view key = argv[1];
            if (key == "auto-record") {
                r = c->settings.set_auto_record(*value);
            } else if (key == "auto-play") {
                r = c->settings.set_auto_play(*value);
            } else if (key == "notification") {
                r = c->settings.set_notification(*value);
            } else if (key == "bluetooth-tone") {
                r = c->settings.set_bluetooth_tone(*value);
            } else {
                out->write("unknown setting: ");
                out->write_line(key);
                return true;
            }

            if (!r.ok()) {
                print_error(*out, r);
                return true;
            }
            out->write_line("ok");
            return true;
        });

    // ---------- storage / power ----------

    registry.register_command({"card", "storage usage", "card"},
        [out, c](const auto&) {
            auto r = c->system.card_info();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            const auto& ci = r.value;
            out->write_line(fmt("used:     %s", human_size(ci.usedBytes).c_str()));
            out->write_line(fmt("capacity: %s", human_size(ci.capacityBytes).c_str()));
            out->write_line(fmt("status:   %s", ci.statusText.c_str()));
            return true;
        });

    registry.register_command({"battery", "battery state (P1 only)", "battery"},
        [out, c](const auto&) {
            auto r = c->system.battery_status();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            const auto& b = r.value;
            out->write_line(fmt("%s, %d%%, %u mV", device::to_string(b.state), b.percent, (unsigned)b.voltage));
            return true;
        });

    // ---------- bluetooth ----------

    registry.register_command({"bt-status", "headset link status (P1 only)", "bt-status"},
        [out, c](const auto&) {
            auto r = c->bluetooth.status();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            const auto& s = r.value;
            out->write_line(fmt("state: %s", device::to_string(s.state)));
            if (!s.name.empty() || !s.mac.empty()) {
                out->write_line(fmt("peer:  %s [%s]", s.name.c_str(), s.mac.c_str()));
            }
            if (s.hasProfiles) {
                out->write_line(fmt("a2dp=%s hfp=%s avrcp=%s battery=%d%%",
                                    on_off(s.a2dp), on_off(s.hfp), on_off(s.avrcp), s.batteryPercent));
            }
            return true;
        });

    registry.register_command({"bt-scan", "scan for headsets (P1 only)", "bt-scan [seconds]"},
        [reg, out, c](const std::vector<std::string_view>& argv) {
            int seconds = 30;
            if (argv.size() == 2) {
                const auto v = parse_u64(argv[1]);
                if (!v || *v > 3600) {
                    print_usage(*out, *reg, "bt-scan");
                    return true;
                }
                seconds = static_cast<int>(*v);
            }
            const IOResult r = c->bluetooth.start_scan(seconds);
            if (!r.ok()) {
                print_error(*out, r);
                return true;
            }
            out->write_line("scan started; use bt-results");
            return true;
        });

    registry.register_command({"bt-results", "devices found by the last scan", "bt-results"},
        [out, c](const auto&) {
            auto r = c->bluetooth.scan_results();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            for (const auto& d : r.value) {
                out->write_line(fmt("%s  %4d dBm  %s%s", d.mac.c_str(), d.rssi, d.name.c_str(),
                                    d.audio ? "  (audio)" : ""));
            }
            out->write_line(fmt("%zu device(s)", r.value.size()));
            return true;
        });

    registry.register_command({"bt-paired", "paired headsets", "bt-paired"},
        [out, c](const auto&) {
            auto r = c->bluetooth.paired_devices();
            if (!r.ok()) {
                print_error(*out, r.error);
                return true;
            }
            for (const auto& d : r.value) {
                out->write_line(fmt("#%u %s  %s", (unsigned)d.sequence, d.mac.c_str(), d.name.c_str()));
            }
            out->write_line(fmt("%zu device(s)", r.value.size()));
            return true;
        });

    // ---------- firmware ----------

    registry.register_command({"fw-check", "ask the vendor service for newer firmware", "fw-check"},
        [out, c](const auto&) {
            if (!c->firmware) {
                out->write_line("firmware service not configured");
                return true;
            }
            if (!c->session.is_connected()) {
                print_error(*out, IOResult::failure(io::IOStatus::NotConnected));
                return true;
            }

            const std::string model = device::model_name(c->session.model());
            auto pending = c->firmware->fetch_latest_async(model, c->accessToken);
            while (pending.wait_for(std::chrono::milliseconds(250)) != std::future_status::ready) {
                out->write(".");
            }
            const auto lookup = pending.get();
            out->write_line("");
            if (!lookup.ok()) {
                print_error(*out, lookup.error);
                return true;
            }
            if (!lookup.info) {
                out->write_line("no firmware published for " + model);
                return true;
            }

            const auto& fw = *lookup.info;
            const bool newer = fw.versionNumber > c->session.version_number();
            out->write_line(fmt("latest:    %s (%u) %s", fw.versionCode.c_str(), (unsigned)fw.versionNumber,
                                newer ? "[update available]" : "[up to date]"));
            out->write_line(fmt("installed: %s", c->session.version_code().c_str()));
            if (!fw.remark.empty()) {
                out->write_line(fw.remark);
            }
            return true;
        });
}

} // namespace hidock::console
