#include "ResumableDownloader.hpp"
#include "AssetStore.hpp"
#include "HttpSource.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace fv {

namespace {

constexpr int64_t kMaxBackoffMs = 60000;

/// base * 2^(attempt-1), capped at kMaxBackoffMs.
std::chrono::milliseconds backoff_delay(int base_ms, int attempt) {
    const int64_t base = std::max<int64_t>(0, base_ms);
    const int shift = std::min(std::max(attempt - 1, 0), 20);
    return std::chrono::milliseconds(std::min(base << shift, kMaxBackoffMs));
}

int64_t size_or_zero(const fs::path& p) {
    std::error_code ec;
    auto size = fs::file_size(p, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

bool remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        FV_LOG_WARN("ResumableDownloader", "Could not delete " + p.string() + ": " + ec.message());
        return false;
    }
    return true;
}

fs::path tmp_path_for(const fs::path& dest) {
    return fs::path(dest.string() + ".tmp");
}

} // namespace

/// Mutable state of one download() call.
struct ResumableDownloader::BundleJob {
    const ModelBundle&                 bundle;
    fs::path                           dir;
    int64_t                            total_bytes = 0;
    int64_t                            completed_bytes = 0;   // files already in place
    float                              last_progress = 0.0f;
    ProgressCallback                   on_progress;
    std::shared_ptr<std::atomic<bool>> cancelled;
    int64_t                            bytes_fetched = 0;
    int                                requests = 0;
};

ResumableDownloader::ResumableDownloader(AssetStore& store, std::shared_ptr<HttpSource> http,
                                         DownloadOptions options)
    : store_(store), http_(std::move(http)), options_(options),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    if (options_.max_attempts < 1) {
        options_.max_attempts = 1;
    }
}

void ResumableDownloader::set_sleep_function(SleepFn sleep) {
    sleep_ = std::move(sleep);
}

// ---------------------------------------------------------------------------
// download
// ---------------------------------------------------------------------------

DownloadResult ResumableDownloader::download(const ModelBundle& bundle, ProgressCallback on_progress) {
    DownloadResult result;

    if (store_.is_complete(bundle)) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            progress_[bundle.id] = 1.0f;
        }
        if (on_progress) on_progress(1.0f);
        result.success = true;
        return result;
    }

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (active_.count(bundle.id)) {
            result.error = "Download already in progress for " + bundle.id;
            FV_LOG_WARN("ResumableDownloader", result.error);
            return result;
        }
        active_[bundle.id] = cancelled;
    }

    BundleJob job{bundle, store_.bundle_dir(bundle)};
    job.total_bytes = bundle.total_size_bytes();
    job.on_progress = std::move(on_progress);
    job.cancelled = cancelled;

    std::error_code ec;
    fs::create_directories(job.dir, ec);
    if (ec) {
        result.error = "Cannot create " + job.dir.string() + ": " + ec.message();
    } else {
        FV_LOG_INFO("ResumableDownloader", "Downloading " + bundle.display_name() + " ("
                    + std::to_string(bundle.total_size_mb()) + " MB) into " + job.dir.string());

        // Credit what is already on disk before any request goes out.
        int64_t already = 0;
        for (const auto& f : bundle.files) {
            fs::path dest = job.dir / f.name;
            int64_t have = size_or_zero(dest);
            if (have == f.expected_size) {
                already += have;
            } else {
                if (fs::exists(dest, ec)) {
                    FV_LOG_DEBUG("ResumableDownloader", "Removing incomplete file: " + f.name);
                    remove_quietly(dest);
                }
                already += std::min(size_or_zero(tmp_path_for(dest)), f.expected_size);
            }
        }
        report(job, already);

        result.success = true;
        for (const auto& f : bundle.files) {
            fs::path dest = job.dir / f.name;
            if (size_or_zero(dest) == f.expected_size && fs::exists(dest, ec)) {
                job.completed_bytes += f.expected_size;
                continue;
            }
            if (!fetch_with_retries(job, f, result)) {
                result.success = false;
                break;
            }
            job.completed_bytes += f.expected_size;
        }
    }

    result.bytes_fetched = job.bytes_fetched;
    if (result.success) {
        result.attempts = job.requests;
        report(job, job.total_bytes);
        FV_LOG_INFO("ResumableDownloader", "Model " + bundle.display_name() + " download complete");
    } else {
        FV_LOG_ERROR("ResumableDownloader", "Failed to download " + bundle.id
                     + (result.failed_file.empty() ? "" : " (" + result.failed_file + ")")
                     + ": " + result.error);
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        active_.erase(bundle.id);
    }
    return result;
}

std::future<DownloadResult> ResumableDownloader::download_async(const ModelBundle& bundle,
                                                                ProgressCallback on_progress) {
    return std::async(std::launch::async, [this, bundle, cb = std::move(on_progress)]() {
        return download(bundle, cb);
    });
}

// ---------------------------------------------------------------------------
// Per-file transfer
// ---------------------------------------------------------------------------

bool ResumableDownloader::fetch_with_retries(BundleJob& job, const ModelFile& file,
                                             DownloadResult& result) {
    std::string error;
    int attempt = 0;

    while (attempt < options_.max_attempts) {
        if (job.cancelled->load()) {
            error = "Download cancelled";
            break;
        }

        ++attempt;
        FV_LOG_DEBUG("ResumableDownloader", "Downloading " + file.name + " (attempt "
                     + std::to_string(attempt) + "/" + std::to_string(options_.max_attempts) + ")");

        if (attempt_once(job, file, error)) {
            FV_LOG_DEBUG("ResumableDownloader", "Downloaded " + file.name);
            return true;
        }
        if (job.cancelled->load()) {
            error = "Download cancelled";
            break;
        }

        FV_LOG_WARN("ResumableDownloader", file.name + " attempt " + std::to_string(attempt)
                    + " failed: " + error);

        if (attempt < options_.max_attempts) {
            sleep_(backoff_delay(options_.backoff_ms, attempt));
        }
    }

    result.error = error;
    result.failed_file = file.name;
    result.attempts = attempt;
    return false;
}

bool ResumableDownloader::attempt_once(BundleJob& job, const ModelFile& file, std::string& error) {
    const fs::path dest = job.dir / file.name;
    const fs::path tmp = tmp_path_for(dest);

    int64_t partial = size_or_zero(tmp);
    if (partial > file.expected_size) {
        FV_LOG_DEBUG("ResumableDownloader", "Discarding oversized partial " + tmp.string());
        remove_quietly(tmp);
        partial = 0;
    }

    if (partial < file.expected_size) {
        const std::string url = job.bundle.base_url + "/" + file.name;
        std::ofstream out;
        int64_t written = partial;
        bool write_failed = false;
        bool oversized = false;

        auto on_status = [&](long status) {
            if (status == 206) {
                out.open(tmp, std::ios::binary | std::ios::app);
            } else if (status == 200) {
                if (partial > 0) {
                    FV_LOG_INFO("ResumableDownloader", "Server ignored range for " + file.name
                                + ", restarting from zero");
                }
                written = 0;
                out.open(tmp, std::ios::binary | std::ios::trunc);
            } else {
                return false;
            }
            if (!out) {
                write_failed = true;
                return false;
            }
            return true;
        };

        auto on_data = [&](const char* data, size_t len) {
            if (job.cancelled->load()) {
                return false;
            }
            if (written + static_cast<int64_t>(len) > file.expected_size) {
                oversized = true;
                return false;
            }
            out.write(data, static_cast<std::streamsize>(len));
            if (!out) {
                write_failed = true;
                return false;
            }
            written += static_cast<int64_t>(len);
            job.bytes_fetched += static_cast<int64_t>(len);
            report(job, job.completed_bytes + written);
            return true;
        };

        ++job.requests;
        HttpResponse resp = http_->fetch(url, partial, on_status, on_data);
        if (out.is_open()) {
            out.close();
        }

        if (job.cancelled->load()) {
            error = "Download cancelled";
            return false;
        }
        if (resp.status == 416) {
            remove_quietly(tmp);
            error = "HTTP 416 for " + file.name + ", partial discarded";
            return false;
        }
        if (write_failed) {
            error = "Cannot write " + tmp.string();
            return false;
        }
        if (oversized) {
            remove_quietly(tmp);
            error = "Download incomplete: server sent more than " + std::to_string(file.expected_size)
                    + " bytes";
            return false;
        }
        if (resp.status != 200 && resp.status != 206) {
            error = resp.status == 0 ? (resp.error.empty() ? "connection failed" : resp.error)
                                     : "HTTP " + std::to_string(resp.status) + " from " + url;
            return false;
        }
        if (!resp.transport_ok) {
            // Keep the partial; the next attempt resumes from it.
            error = resp.error.empty() ? "transfer interrupted" : resp.error;
            return false;
        }
    }

    int64_t got = size_or_zero(tmp);
    if (got != file.expected_size) {
        remove_quietly(tmp);
        error = "Download incomplete: got " + std::to_string(got) + " bytes, expected "
                + std::to_string(file.expected_size);
        return false;
    }

    std::error_code ec;
    fs::rename(tmp, dest, ec);
    if (ec) {
        error = "Failed to rename temp file: " + ec.message();
        return false;
    }
    return true;
}

void ResumableDownloader::report(BundleJob& job, int64_t done_bytes) {
    float p = job.total_bytes > 0
                  ? static_cast<float>(static_cast<double>(done_bytes) / static_cast<double>(job.total_bytes))
                  : 1.0f;
    p = std::min(1.0f, std::max(0.0f, p));
    if (p < job.last_progress) {
        return;
    }
    job.last_progress = p;
    {
        std::lock_guard<std::mutex> lock(mu_);
        progress_[job.bundle.id] = p;
    }
    if (job.on_progress) {
        job.on_progress(p);
    }
}

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

std::optional<float> ResumableDownloader::progress(const std::string& bundle_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = progress_.find(bundle_id);
    if (it == progress_.end()) return std::nullopt;
    return it->second;
}

bool ResumableDownloader::is_downloading(const std::string& bundle_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return active_.count(bundle_id) > 0;
}

std::vector<std::string> ResumableDownloader::active_downloads() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> ids;
    for (const auto& kv : active_) ids.push_back(kv.first);
    return ids;
}

bool ResumableDownloader::cancel(const std::string& bundle_id) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = active_.find(bundle_id);
    if (it == active_.end()) return false;
    it->second->store(true);
    FV_LOG_INFO("ResumableDownloader", "Cancelling download of " + bundle_id);
    return true;
}

} // namespace fv
