#pragma once

#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fv {

class AssetStore;
class HttpSource;

/// Outcome of ResumableDownloader::download().
struct DownloadResult {
    bool        success = false;
    std::string error;           // human-readable, empty on success
    std::string failed_file;     // manifest name of the file that failed
    int         attempts = 0;    // attempts spent on the failing file, or
                                 // requests made in total on success
    int64_t     bytes_fetched = 0;
};

struct DownloadOptions {
    int max_attempts = 3;
    int backoff_ms   = 1000;     // doubled after every failed attempt, up to 60 s
};

/// Fetches the files of a ModelBundle into its AssetStore directory.
///
/// Files are fetched one after another.  Each goes to `<name>.tmp`, resumed
/// with a Range request when a partial exists, checked against its exact
/// expected size and renamed into place.  Transient and integrity failures
/// are retried with exponential backoff; files completed earlier are kept
/// when a later one gives up.
///
/// Different bundles may download in parallel; a second download of a
/// bundle that is already downloading is refused.
class ResumableDownloader {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    ResumableDownloader(AssetStore& store, std::shared_ptr<HttpSource> http,
                        DownloadOptions options = {});

    // Non-copyable.
    ResumableDownloader(const ResumableDownloader&) = delete;
    ResumableDownloader& operator=(const ResumableDownloader&) = delete;

    /// Replace the backoff sleep (tests use a recording no-op).
    void set_sleep_function(SleepFn sleep);

    /// Blocking download.  Never throws.  `on_progress` receives the
    /// bundle-wide fraction in [0, 1], never decreasing.
    DownloadResult download(const ModelBundle& bundle, ProgressCallback on_progress = nullptr);

    /// Run download() on its own thread.  The downloader must outlive the
    /// returned future.
    std::future<DownloadResult> download_async(const ModelBundle& bundle,
                                               ProgressCallback on_progress = nullptr);

    /// Last reported fraction for a bundle downloading now or earlier in
    /// this process.
    std::optional<float> progress(const std::string& bundle_id) const;

    bool is_downloading(const std::string& bundle_id) const;

    std::vector<std::string> active_downloads() const;

    /// Abort an in-flight download.  The partial `.tmp` stays for a later
    /// resume.  Returns false if the bundle is not downloading.
    bool cancel(const std::string& bundle_id);

private:
    struct BundleJob;

    bool fetch_with_retries(BundleJob& job, const ModelFile& file, DownloadResult& result);
    bool attempt_once(BundleJob& job, const ModelFile& file, std::string& error);
    void report(BundleJob& job, int64_t done_bytes);

    AssetStore&                  store_;
    std::shared_ptr<HttpSource>  http_;
    DownloadOptions              options_;
    SleepFn                      sleep_;

    std::map<std::string, std::shared_ptr<std::atomic<bool>>> active_;   // id -> cancel flag
    std::map<std::string, float> progress_;
    mutable std::mutex           mu_;
};

} // namespace fv
