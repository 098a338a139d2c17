#include "hidock/firmware/firmware_catalog.h"
#include "hidock/crypto/md5.h"

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace hidock::firmware {

using io::IOResult;
using io::IOStatus;

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return (n && !n.IsNull()) ? n.as<T>() : def;
}

// The service speaks JSON; yaml-cpp reads it as flow-style YAML.
FirmwareLookup parse_latest_response(const std::string& json)
{
    FirmwareLookup out;

    YAML::Node root;
    try {
        root = YAML::Load(json);
    } catch (const YAML::Exception& ex) {
        out.error = IOResult::failure(IOStatus::InvalidResponse, std::string("bad JSON: ") + ex.what());
        return out;
    }
    if (!root.IsMap()) {
        out.error = IOResult::failure(IOStatus::InvalidResponse, "response is not an object");
        return out;
    }

    try {
        const int err = get_or<int>(root, "error", -1);
        if (err != 0) {
            out.error = IOResult::failure(IOStatus::CommandFailed,
                get_or<std::string>(root, "message", "firmware service error " + std::to_string(err)));
            return out;
        }

        const YAML::Node data = root["data"];
        if (!data || data.IsNull()) {
            return out;
        }

        FirmwareInfo info;
        info.id            = get_or<std::string>(data, "id", "");
        info.model         = get_or<std::string>(data, "model", "");
        info.versionCode   = get_or<std::string>(data, "versionCode", "");
        info.versionNumber = get_or<std::uint32_t>(data, "versionNumber", 0);
        info.signature     = get_or<std::string>(data, "signature", "");
        info.fileName      = get_or<std::string>(data, "fileName", "");
        info.fileLength    = get_or<std::uint64_t>(data, "fileLength", 0);
        info.remark        = get_or<std::string>(data, "remark", "");
        if (info.id.empty()) {
            out.error = IOResult::failure(IOStatus::InvalidResponse, "firmware entry without id");
            return out;
        }
        out.info = std::move(info);
    } catch (const YAML::Exception& ex) {
        out.error = IOResult::failure(IOStatus::InvalidResponse, ex.what());
    }
    return out;
}

FirmwareLookup FirmwareCatalog::fetch_latest(const std::string& model, const std::string& accessToken)
{
    const HttpHeaders headers{
        {"Content-Type", "application/x-www-form-urlencoded"},
        {"Accept", "application/json"},
        {"AccessToken", accessToken},
    };
    const std::string body = "version=-1&model=" + model + "&lang=en";

    HD_LOGD(_log, "POST %s model=%s", latest_url().c_str(), model.c_str());
    const HttpResponse resp = _http.post(latest_url(), headers, body);
    if (!resp.error.ok()) {
        HD_LOGE(_log, "lookup failed: %s", resp.error.message.c_str());
        return FirmwareLookup{resp.error, std::nullopt};
    }
    if (!resp.ok()) {
        return FirmwareLookup{
            IOResult::failure(IOStatus::IOError, "HTTP " + std::to_string(resp.httpCode)),
            std::nullopt};
    }

    FirmwareLookup result = parse_latest_response(std::string(resp.body.begin(), resp.body.end()));
    if (result.ok() && result.info) {
        HD_LOGI(_log, "latest firmware for %s: %s (%u)",
                model.c_str(), result.info->versionCode.c_str(), (unsigned)result.info->versionNumber);
    }
    return result;
}

FirmwareDownload FirmwareCatalog::download(const FirmwareInfo& info, const HttpProgressFn& onProgress)
{
    FirmwareDownload out;
    std::size_t last = 0;

    // Progress is clamped so callers only ever see growing values.
    const HttpResponse resp = _http.get(download_url(info), {},
        [&](std::size_t got, std::size_t total) {
            if (got < last) {
                return;
            }
            last = got;
            if (onProgress) {
                onProgress(got, total != 0 ? total : static_cast<std::size_t>(info.fileLength));
            }
        });

    if (!resp.error.ok()) {
        out.error = resp.error;
        return out;
    }
    if (!resp.ok()) {
        out.error = IOResult::failure(IOStatus::IOError, "HTTP " + std::to_string(resp.httpCode));
        return out;
    }

    out.image.assign(resp.body.begin(), resp.body.end());

    if (info.fileLength != 0 && out.image.size() != info.fileLength) {
        out.error = IOResult::failure(IOStatus::TransferFailed, "firmware length mismatch");
        out.image.clear();
        return out;
    }

    if (!info.signature.empty()) {
        std::string actual;
        try {
            actual = crypto::md5_hex(out.image.data(), out.image.size());
        } catch (const std::runtime_error& ex) {
            out.error = IOResult::failure(IOStatus::IOError, ex.what());
            out.image.clear();
            return out;
        }
        if (!crypto::hex_equal(actual, info.signature)) {
            HD_LOGE(_log, "firmware %s signature mismatch", info.fileName.c_str());
            out.error = IOResult::failure(IOStatus::TransferFailed, "firmware signature mismatch");
            out.image.clear();
            return out;
        }
    }

    if (onProgress && last != out.image.size()) {
        onProgress(out.image.size(), out.image.size());
    }

    HD_LOGI(_log, "downloaded firmware %s (%zu bytes)", info.fileName.c_str(), out.image.size());
    return out;
}

std::future<FirmwareLookup> FirmwareCatalog::fetch_latest_async(const std::string& model,
                                                                const std::string& accessToken)
{
    return std::async(std::launch::async, [this, model, accessToken] {
        return fetch_latest(model, accessToken);
    });
}

std::future<FirmwareDownload> FirmwareCatalog::download_async(const FirmwareInfo& info,
                                                              HttpProgressFn onProgress)
{
    return std::async(std::launch::async, [this, info, onProgress = std::move(onProgress)] {
        return download(info, onProgress);
    });
}

} // namespace hidock::firmware
