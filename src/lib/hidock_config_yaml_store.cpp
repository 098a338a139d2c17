#include "hidock/config/hidock_config_yaml_store.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace hidock::config {

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, GeneralConfig& out)
{
    out.logLevel = log::parse_level(get_or<std::string>(node, "log_level", "info"));
    out.safeMode = get_or<bool>(node, "safe_mode", false);
}

static void from_yaml(const YAML::Node& node, UsbConfig& out)
{
    if (auto ids = node["vendor_ids"]; ids && ids.IsSequence()) {
        out.vendorIds.clear();
        for (const auto& id : ids) {
            out.vendorIds.push_back(static_cast<std::uint16_t>(id.as<int>()));
        }
    }
    out.interfaceNumber = get_or<int>(node, "interface", 0);
    out.endpointOut     = static_cast<std::uint8_t>(get_or<int>(node, "endpoint_out", 0x01));
    out.endpointIn      = static_cast<std::uint8_t>(get_or<int>(node, "endpoint_in", 0x82));
    out.readBufferSize  = get_or<std::size_t>(node, "read_buffer_size", 512 * 1024);
}

static void from_yaml(const YAML::Node& node, TimeoutConfig& out)
{
    out.commandMs           = get_or<std::uint32_t>(node, "command_ms", 5000);
    out.transferChunkMs     = get_or<std::uint32_t>(node, "transfer_chunk_ms", 5000);
    out.fileListMs          = get_or<std::uint32_t>(node, "file_list_ms", 30000);
    out.keepaliveIntervalMs = get_or<std::uint32_t>(node, "keepalive_interval_ms", 5000);
}

static void from_yaml(const YAML::Node& node, TransferConfig& out)
{
    out.uploadChunkSize = get_or<std::size_t>(node, "upload_chunk_size", 512);
    if (out.uploadChunkSize == 0) {
        out.uploadChunkSize = 512;
    }
}

static void from_yaml(const YAML::Node& node, FirmwareConfig& out)
{
    out.apiBase     = get_or<std::string>(node, "api_base", "https://hinotes.hidock.com");
    out.accessToken = get_or<std::string>(node, "access_token", "");
}

static void from_yaml(const YAML::Node& root, HidockConfig& cfg)
{
    if (auto n = root["general"])   from_yaml(n, cfg.general);
    if (auto n = root["usb"])       from_yaml(n, cfg.usb);
    if (auto n = root["timeouts"])  from_yaml(n, cfg.timeouts);
    if (auto n = root["transfer"])  from_yaml(n, cfg.transfer);
    if (auto n = root["firmware"])  from_yaml(n, cfg.firmware);
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const HidockConfig& cfg)
{
    out << YAML::BeginMap;

    out << YAML::Key << "general" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << log::level_name(cfg.general.logLevel);
    out << YAML::Key << "safe_mode" << YAML::Value << cfg.general.safeMode;
    out << YAML::EndMap;

    out << YAML::Key << "usb" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "vendor_ids" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (auto id : cfg.usb.vendorIds) {
        out << YAML::Hex << static_cast<int>(id);
    }
    out << YAML::EndSeq;
    out << YAML::Key << "interface"        << YAML::Value << YAML::Dec << cfg.usb.interfaceNumber;
    out << YAML::Key << "endpoint_out"     << YAML::Value << YAML::Hex << static_cast<int>(cfg.usb.endpointOut);
    out << YAML::Key << "endpoint_in"      << YAML::Value << YAML::Hex << static_cast<int>(cfg.usb.endpointIn);
    out << YAML::Key << "read_buffer_size" << YAML::Value << YAML::Dec << cfg.usb.readBufferSize;
    out << YAML::EndMap;

    out << YAML::Key << "timeouts" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "command_ms"            << YAML::Value << cfg.timeouts.commandMs;
    out << YAML::Key << "transfer_chunk_ms"     << YAML::Value << cfg.timeouts.transferChunkMs;
    out << YAML::Key << "file_list_ms"          << YAML::Value << cfg.timeouts.fileListMs;
    out << YAML::Key << "keepalive_interval_ms" << YAML::Value << cfg.timeouts.keepaliveIntervalMs;
    out << YAML::EndMap;

    out << YAML::Key << "transfer" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "upload_chunk_size" << YAML::Value << cfg.transfer.uploadChunkSize;
    out << YAML::EndMap;

    out << YAML::Key << "firmware" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "api_base"     << YAML::Value << cfg.firmware.apiBase;
    out << YAML::Key << "access_token" << YAML::Value << cfg.firmware.accessToken;
    out << YAML::EndMap;

    out << YAML::EndMap;
}

// ---------- YamlConfigStore ----------

YamlConfigStore::YamlConfigStore(std::string path, log::Logger logger)
    : _path(std::move(path))
    , _log(logger.with_tag("config"))
{
}

HidockConfig YamlConfigStore::parse(const std::string& yamlText)
{
    HidockConfig cfg{};
    if (yamlText.empty()) {
        return cfg;
    }
    YAML::Node root = YAML::Load(yamlText);
    from_yaml(root, cfg);
    return cfg;
}

std::string YamlConfigStore::emit(const HidockConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return out.c_str();
}

HidockConfig YamlConfigStore::load()
{
    std::ifstream in(_path);
    if (!in) {
        HD_LOGW(_log, "Config '%s' not found; writing defaults", _path.c_str());
        HidockConfig cfg{};
        try {
            save(cfg);
        } catch (const std::exception& ex) {
            HD_LOGE(_log, "Failed to write default config '%s': %s", _path.c_str(), ex.what());
        }
        return cfg;
    }

    std::stringstream ss;
    ss << in.rdbuf();

    try {
        HidockConfig cfg = parse(ss.str());
        HD_LOGI(_log, "Loaded config from '%s'", _path.c_str());
        return cfg;
    } catch (const YAML::Exception& ex) {
        HD_LOGE(_log, "Failed to parse config '%s': %s; using defaults", _path.c_str(), ex.what());
    }
    return HidockConfig{};
}

void YamlConfigStore::save(const HidockConfig& cfg)
{
    const std::string text = emit(cfg);

    std::ofstream out(_path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("open for write failed: " + _path);
    }
    out << text << '\n';
    if (!out) {
        throw std::runtime_error("short write while saving config");
    }
    HD_LOGI(_log, "Saved config to '%s'", _path.c_str());
}

} // namespace hidock::config
