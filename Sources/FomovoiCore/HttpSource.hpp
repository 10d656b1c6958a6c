#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace fv {

/// Outcome of one HTTP exchange.  `transport_ok` is false when the
/// connection failed, timed out or was aborted before the body finished.
struct HttpResponse {
    long        status = 0;
    bool        transport_ok = false;
    bool        aborted = false;      // a callback returned false
    std::string error;
};

/// Minimal HTTP GET capability used by the downloader and model discovery.
class HttpSource {
public:
    /// Receives the final status code once, before any body bytes.
    /// Return false to abort the transfer.
    using StatusFn = std::function<bool(long status)>;

    /// Receives body bytes.  Return false to abort the transfer.
    using DataFn = std::function<bool(const char* data, size_t len)>;

    virtual ~HttpSource() = default;

    /// GET `url`, asking for bytes from `offset` onward when offset > 0
    /// (`Range: bytes=<offset>-`).  Body bytes are forwarded only for
    /// 200 and 206 responses.
    virtual HttpResponse fetch(const std::string& url, int64_t offset,
                               const StatusFn& on_status, const DataFn& on_data) = 0;

    /// GET a small text resource into `body`.
    HttpResponse get_text(const std::string& url, std::string& body) {
        body.clear();
        return fetch(url, 0, nullptr, [&body](const char* data, size_t len) {
            body.append(data, len);
            return true;
        });
    }
};

} // namespace fv
