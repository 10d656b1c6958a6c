#include "CurlHttpSource.hpp"
#include "Logger.hpp"

#include <mutex>

#include <curl/curl.h>

namespace fv {

namespace {

std::once_flag g_curl_init;

/// Per-transfer state handed to the libcurl callbacks.
struct Transfer {
    CURL*                     curl = nullptr;
    const HttpSource::StatusFn* on_status = nullptr;
    const HttpSource::DataFn*   on_data = nullptr;
    long                      status = 0;
    bool                      status_reported = false;
    bool                      forward_body = false;
    bool                      aborted = false;
};

/// Report the status once; decides whether the body is forwarded.
bool report_status(Transfer& t, long status) {
    t.status = status;
    t.status_reported = true;
    t.forward_body = (status == 200 || status == 206);
    if (t.on_status && *t.on_status && !(*t.on_status)(status)) {
        t.aborted = true;
        return false;
    }
    return true;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t len = size * nmemb;

    if (!t->status_reported) {
        long code = 0;
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &code);
        if (!report_status(*t, code)) {
            return 0;
        }
    }

    if (!t->forward_body) {
        return len;   // swallow error pages
    }
    if (t->on_data && *t->on_data && !(*t->on_data)(ptr, len)) {
        t->aborted = true;
        return 0;
    }
    return len;
}

} // namespace

CurlHttpSource::CurlHttpSource(CurlOptions options)
    : options_(std::move(options)) {
    std::call_once(g_curl_init, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

HttpResponse CurlHttpSource::fetch(const std::string& url, int64_t offset,
                                   const StatusFn& on_status, const DataFn& on_data) {
    HttpResponse resp;

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    Transfer t;
    t.curl = curl;
    t.on_status = &on_status;
    t.on_data = &on_data;

    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_timeout_s));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &t);

    std::string range;
    if (offset > 0) {
        range = std::to_string(offset) + "-";
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);

    // Responses without a body never reach write_callback.
    if (!t.status_reported && rc == CURLE_OK) {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        report_status(t, code);
    }
    if (!t.status_reported) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &t.status);
    }

    resp.status = t.status;
    resp.aborted = t.aborted;
    resp.transport_ok = (rc == CURLE_OK) && !t.aborted;
    if (rc != CURLE_OK && !t.aborted) {
        resp.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        FV_LOG_DEBUG("CurlHttpSource", "GET " + url + " failed: " + resp.error);
    }

    curl_easy_cleanup(curl);
    return resp;
}

} // namespace fv
