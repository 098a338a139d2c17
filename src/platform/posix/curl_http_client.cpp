#include "hidock/platform/posix/curl_http_client.h"

#include <limits>
#include <memory>
#include <string>

// curl headers are only included in curl-specific files
#include <curl/curl.h>

namespace hidock::platform::posix {

using firmware::HttpHeaders;
using firmware::HttpProgressFn;
using firmware::HttpResponse;
using io::IOResult;
using io::IOStatus;

static void ensure_curl_global_init()
{
    static const bool inited = []{
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

namespace {

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

struct PerformState {
    std::vector<char>*    body{nullptr};
    const HttpProgressFn* progress{nullptr};
};

} // namespace

static std::size_t write_body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* state = static_cast<PerformState*>(userdata);
    if (!state || !state->body)
        return 0;

    // Guard overflow: n = size * nmemb
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size))
        return 0; // abort transfer

    const std::size_t n = size * nmemb;
    if (n == 0 || !ptr)
        return 0;

    state->body->insert(state->body->end(), ptr, ptr + n);
    return n;
}

static int xfer_info_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t)
{
    auto* state = static_cast<PerformState*>(userdata);
    if (state && state->progress && *state->progress && dlnow > 0) {
        (*state->progress)(static_cast<std::size_t>(dlnow),
                           dltotal > 0 ? static_cast<std::size_t>(dltotal) : 0);
    }
    return 0;
}

CurlHttpClient::CurlHttpClient(log::Logger logger, long timeoutSeconds)
    : _log(logger.with_tag("http"))
    , _timeoutSeconds(timeoutSeconds)
{
    ensure_curl_global_init();
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const HttpHeaders& headers,
                                  const std::string& body)
{
    return perform(url, headers, &body, nullptr);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const HttpHeaders& headers,
                                 const HttpProgressFn& onProgress)
{
    return perform(url, headers, nullptr, &onProgress);
}

HttpResponse CurlHttpClient::perform(const std::string& url,
                                     const HttpHeaders& headers,
                                     const std::string* postBody,
                                     const HttpProgressFn* onProgress)
{
    HttpResponse resp;

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        resp.error = IOResult::failure(IOStatus::IOError, "curl_easy_init failed");
        return resp;
    }

    curl_slist* raw = nullptr;
    for (const auto& kv : headers) {
        std::string line;
        line.reserve(kv.first.size() + 2 + kv.second.size());
        line.append(kv.first);
        line.append(": ");
        line.append(kv.second);
        raw = curl_slist_append(raw, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> slist(raw);

    PerformState state{&resp.body, onProgress};

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    if (slist) {
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, slist.get());
    }
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, &write_body_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, _timeoutSeconds);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

    if (postBody) {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, postBody->c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(postBody->size()));
    } else {
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    }

    if (onProgress && *onProgress) {
        curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, &xfer_info_cb);
        curl_easy_setopt(c, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    }

    HD_LOGD(_log, "%s %s", postBody ? "POST" : "GET", url.c_str());

    const CURLcode res = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.httpCode);

    if (res != CURLE_OK) {
        const IOStatus st = (res == CURLE_OPERATION_TIMEDOUT) ? IOStatus::Timeout : IOStatus::IOError;
        resp.error = IOResult::failure(st, curl_easy_strerror(res));
        HD_LOGW(_log, "request to %s failed: %s", url.c_str(), curl_easy_strerror(res));
        return resp;
    }

    HD_LOGD(_log, "HTTP %ld, %zu bytes", resp.httpCode, resp.body.size());
    return resp;
}

} // namespace hidock::platform::posix
