#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "hidock/config/hidock_config_yaml_store.h"
#include "hidock/console/console_engine.h"
#include "hidock/console/device_commands.h"
#include "hidock/core/logging.h"
#include "hidock/device/keep_alive.h"
#include "hidock/device/transfer_engine.h"
#include "hidock/io/transport/safe_transport.h"
#include "hidock/platform/posix/curl_http_client.h"
#include "hidock/platform/posix/usb_transport.h"

using namespace hidock;

static const char* kDefaultConfigPath = "hidock.yaml";

int main(int argc, char** argv)
{
    if (argc > 2) {
        std::fprintf(stderr, "usage: %s [config.yaml]\n", argv[0]);
        return 2;
    }
    const std::string configPath = (argc == 2) ? argv[1] : kDefaultConfigPath;

    log::StdioLogSink sink;

    // Config is read before its log level is known.
    config::YamlConfigStore store(configPath, log::Logger(&sink, log::Level::Warn));
    const config::HidockConfig cfg = store.load();

    log::Logger logger(&sink, cfg.general.logLevel, "hidock");
    HD_LOGI(logger, "hidock-console starting, config '%s'", configPath.c_str());

    platform::posix::UsbTransport usb(cfg.usb, logger);
    std::unique_ptr<io::SafeTransport> safe;
    io::ITransport* transport = &usb;
    if (cfg.general.safeMode) {
        safe = std::make_unique<io::SafeTransport>(usb, logger);
        transport = safe.get();
        HD_LOGI(logger, "safe mode: only read-only commands reach the device");
    }

    device::SessionOptions sessionOptions;
    sessionOptions.commandTimeout = io::Millis(cfg.timeouts.commandMs);
    device::DeviceSession session(*transport, logger, sessionOptions);

    device::TransferOptions transferOptions;
    transferOptions.chunkTimeout    = io::Millis(cfg.timeouts.transferChunkMs);
    transferOptions.uploadChunkSize = cfg.transfer.uploadChunkSize;
    device::TransferEngine transfers(session, transferOptions);

    device::FileListOptions listOptions;
    listOptions.chunkTimeout   = io::Millis(cfg.timeouts.transferChunkMs);
    listOptions.overallTimeout = io::Millis(cfg.timeouts.fileListMs);

    device::FileController      files(session, transfers, listOptions);
    device::TimeController      clock(session);
    device::SettingsController  settings(session);
    device::BluetoothController bluetooth(session);
    device::SystemController    system(session, transfers);

    platform::posix::CurlHttpClient http(logger);
    firmware::FirmwareCatalog catalog(http, cfg.firmware.apiBase, logger);

    const io::IOResult connected = session.connect();
    if (!connected.ok()) {
        HD_LOGE(logger, "no device session: %s %s",
                io::to_string(connected.status), connected.message.c_str());
    }

    device::KeepAlive keepAlive(session, io::Millis(cfg.timeouts.keepaliveIntervalMs));
    if (connected.ok()) {
        keepAlive.start();
    }

    auto consoleIo = console::create_stdio_console_transport();

    console::DeviceCommandContext ctx{session, files, clock, settings, bluetooth, system,
                                      &catalog, cfg.firmware.accessToken, {}};
    ctx.listDevices = [&cfg, &logger]() {
        std::vector<std::string> lines;
        for (const auto& d : platform::posix::list_devices(cfg.usb, logger)) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "bus %03u addr %03u  %04x:%04x  %s",
                          (unsigned)d.bus, (unsigned)d.address,
                          (unsigned)d.vendorId, (unsigned)d.productId,
                          device::model_name(d.model));
            lines.emplace_back(buf);
        }
        return lines;
    };

    console::ConsoleCommandRegistry registry;
    console::register_device_commands(registry, *consoleIo, ctx);

    console::ConsoleEngine engine(registry, *consoleIo);
    engine.run_loop();

    keepAlive.stop();
    session.disconnect();
    HD_LOGI(logger, "hidock-console exiting");
    return 0;
}
