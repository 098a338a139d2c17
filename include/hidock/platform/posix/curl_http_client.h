#pragma once

#include <cstddef>

#include "hidock/core/logging.h"
#include "hidock/firmware/http_client.h"

namespace hidock::platform::posix {

// libcurl-backed IHttpClient. Each call uses its own easy handle, so one
// instance may serve concurrent requests from several workers.
class CurlHttpClient final : public firmware::IHttpClient {
public:
    explicit CurlHttpClient(log::Logger logger = {}, long timeoutSeconds = 120);

    firmware::HttpResponse post(const std::string& url,
                                const firmware::HttpHeaders& headers,
                                const std::string& body) override;

    firmware::HttpResponse get(const std::string& url,
                               const firmware::HttpHeaders& headers,
                               const firmware::HttpProgressFn& onProgress) override;

private:
    firmware::HttpResponse perform(const std::string& url,
                                   const firmware::HttpHeaders& headers,
                                   const std::string* postBody,
                                   const firmware::HttpProgressFn* onProgress);

    log::Logger _log;
    long        _timeoutSeconds;
};

} // namespace hidock::platform::posix
