#pragma once

#include <cstdint>
#include <future>
#include <optional>
#include <string>

#include "hidock/core/logging.h"
#include "hidock/firmware/http_client.h"
#include "hidock/io/io_status.h"
#include "hidock/io/protocol/frame.h"

namespace hidock::firmware {

struct FirmwareInfo {
    std::string   id;
    std::string   model;
    std::string   versionCode;
    std::uint32_t versionNumber{0};
    std::string   signature;      // MD5 hex, may be empty
    std::string   fileName;
    std::uint64_t fileLength{0};
    std::string   remark;
};

struct FirmwareLookup {
    io::IOResult                error{};
    std::optional<FirmwareInfo> info;      // nullopt when no newer firmware exists

    bool ok() const noexcept { return error.ok(); }
};

struct FirmwareDownload {
    io::IOResult             error{};
    io::protocol::ByteBuffer image;

    bool ok() const noexcept { return error.ok(); }
};

// Parses the JSON envelope {error, message, data:{...}} of the "latest" call.
FirmwareLookup parse_latest_response(const std::string& json);

// Queries the vendor firmware service. All network work runs on a
// std::async worker; results arrive through futures.
class FirmwareCatalog {
public:
    FirmwareCatalog(IHttpClient& http, std::string apiBase, log::Logger logger = {})
        : _http(http)
        , _apiBase(std::move(apiBase))
        , _log(logger.with_tag("firmware"))
    {}

    std::future<FirmwareLookup> fetch_latest_async(const std::string& model,
                                                   const std::string& accessToken);

    // Progress is monotonic and ends at (total, total) on success. The image is
    // checked against info.signature when one is given.
    std::future<FirmwareDownload> download_async(const FirmwareInfo& info,
                                                 HttpProgressFn onProgress = {});

    FirmwareLookup   fetch_latest(const std::string& model, const std::string& accessToken);
    FirmwareDownload download(const FirmwareInfo& info, const HttpProgressFn& onProgress);

    std::string latest_url() const { return _apiBase + "/v2/device/firmware/latest"; }
    std::string download_url(const FirmwareInfo& info) const
    {
        return _apiBase + "/v2/device/firmware/get?id=" + info.id;
    }

private:
    IHttpClient& _http;
    std::string  _apiBase;
    log::Logger  _log;
};

} // namespace hidock::firmware
