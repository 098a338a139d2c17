#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "hidock/io/io_status.h"

namespace hidock::firmware {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// (bytesReceived, bytesTotal); total is 0 when the server did not say.
using HttpProgressFn = std::function<void(std::size_t, std::size_t)>;

struct HttpResponse {
    io::IOResult      error{};
    long              httpCode{0};
    std::vector<char> body;

    bool ok() const noexcept { return error.ok() && httpCode >= 200 && httpCode < 300; }
};

// Blocking HTTP client. Callers run it on a worker thread.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const HttpHeaders& headers,
                              const std::string& body) = 0;

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             const HttpProgressFn& onProgress) = 0;
};

} // namespace hidock::firmware
