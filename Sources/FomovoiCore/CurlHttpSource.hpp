#pragma once

#include "HttpSource.hpp"

#include <string>

namespace fv {

struct CurlOptions {
    int         connect_timeout_ms  = 30000;
    int         low_speed_timeout_s = 60;     // abort when < 1 byte/s for this long
    std::string user_agent          = "fomovoi/1.0";
};

/// HttpSource over libcurl's easy interface.  One easy handle per call, so
/// a single instance may serve concurrent downloads.
class CurlHttpSource : public HttpSource {
public:
    explicit CurlHttpSource(CurlOptions options = {});

    HttpResponse fetch(const std::string& url, int64_t offset,
                       const StatusFn& on_status, const DataFn& on_data) override;

private:
    CurlOptions options_;
};

} // namespace fv
