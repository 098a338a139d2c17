#pragma once

#include <string>

#include "hidock/config/hidock_config.h"
#include "hidock/core/logging.h"

namespace hidock::config {

// File-backed YAML implementation of ConfigStore.
//
// load() never throws: a missing file is created with defaults and a file
// that fails to parse is logged and replaced by defaults in memory.
class YamlConfigStore : public ConfigStore {
public:
    explicit YamlConfigStore(std::string path, log::Logger logger = {});

    HidockConfig load() override;
    void         save(const HidockConfig& cfg) override;

    // Text-level helpers, used by load/save and by tests.
    static HidockConfig parse(const std::string& yamlText);
    static std::string  emit(const HidockConfig& cfg);

private:
    std::string _path;
    log::Logger _log;
};

} // namespace hidock::config
