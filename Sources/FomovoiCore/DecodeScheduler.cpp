#include "DecodeScheduler.hpp"
#include "Logger.hpp"

#include <exception>

namespace fv {

namespace {

std::string join_range(const std::map<int64_t, std::string>& results, int64_t end) {
    std::string out;
    for (int64_t i = 0; i < end; ++i) {
        auto it = results.find(i);
        if (it == results.end() || it->second.empty()) continue;
        if (!out.empty()) out += ' ';
        out += it->second;
    }
    return out;
}

} // namespace

DecodeScheduler::DecodeScheduler(DecodeFn decode, size_t num_workers)
    : decode_(std::move(decode)), pool_(num_workers) {}

DecodeScheduler::~DecodeScheduler() {
    cancel();
    pool_.shutdown();
}

void DecodeScheduler::set_decoder(DecodeFn decode) {
    std::lock_guard<std::mutex> lock(mu_);
    decode_ = std::move(decode);
}

void DecodeScheduler::set_completion_callback(CompletionCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    on_complete_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// submit
// ---------------------------------------------------------------------------

int64_t DecodeScheduler::submit(Window window) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mu_);
        window.sequence_index = next_index_++;
        generation = generation_;
        ++in_flight_;
    }
    const int64_t index = window.sequence_index;

    FV_LOG_DEBUG("DecodeScheduler", "Submitting window " + std::to_string(index)
                 + " (" + std::to_string(window.duration_ms()) + " ms"
                 + (window.is_tail ? ", tail" : "") + ")");

    bool queued = pool_.post([this, generation, w = std::move(window)]() {
        run_task(generation, w);
    });
    if (!queued) {
        // Pool is shutting down; resolve as empty so drain_all() cannot hang.
        std::lock_guard<std::mutex> lock(mu_);
        --in_flight_;
        if (generation == generation_) {
            results_.emplace(index, std::string());
        }
        cv_.notify_all();
    }
    return index;
}

void DecodeScheduler::run_task(uint64_t generation, const Window& window) {
    DecodeFn decode;
    {
        std::lock_guard<std::mutex> lock(mu_);
        decode = decode_;
    }

    std::string text;
    bool failed = false;
    if (!decode) {
        FV_LOG_ERROR("DecodeScheduler", "No decoder set, window "
                     + std::to_string(window.sequence_index) + " resolves empty");
        failed = true;
    } else {
        try {
            text = decode(window);
        } catch (const std::exception& e) {
            FV_LOG_WARN("DecodeScheduler", "Decode of window " + std::to_string(window.sequence_index)
                        + " failed: " + e.what());
            text.clear();
            failed = true;
        } catch (...) {
            FV_LOG_WARN("DecodeScheduler", "Decode of window " + std::to_string(window.sequence_index)
                        + " failed with a non-standard exception");
            text.clear();
            failed = true;
        }
    }

    CompletionCallback cb;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (generation != generation_) {
            --in_flight_;
            cv_.notify_all();
            return;   // cancelled or reset meanwhile
        }

        if (failed) {
            ++failure_count_;
            ++consecutive_failures_;
            if (consecutive_failures_ > 1) {
                FV_LOG_WARN("DecodeScheduler", std::to_string(consecutive_failures_)
                            + " consecutive decode failures");
            }
        } else {
            consecutive_failures_ = 0;
            if (text.empty()) {
                FV_LOG_DEBUG("DecodeScheduler", "Window " + std::to_string(window.sequence_index)
                             + " decoded to no text");
            }
        }

        results_.emplace(window.sequence_index, text);
        cb = on_complete_;
    }
    cv_.notify_all();

    if (cb) {
        try {
            cb(window.sequence_index, text);
        } catch (const std::exception& e) {
            FV_LOG_ERROR("DecodeScheduler", std::string("Completion callback threw: ") + e.what());
        } catch (...) {
            FV_LOG_ERROR("DecodeScheduler", "Completion callback threw a non-standard exception");
        }
    }

    // Counted as in flight until the callback returns, so wait_idle()
    // also waits for completion side effects.
    {
        std::lock_guard<std::mutex> lock(mu_);
        --in_flight_;
    }
    cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Ordered reads
// ---------------------------------------------------------------------------

std::string DecodeScheduler::poll_ordered_prefix(int64_t* resolved_prefix) const {
    std::lock_guard<std::mutex> lock(mu_);
    int64_t end = 0;
    while (results_.count(end)) {
        ++end;
    }
    if (resolved_prefix) {
        *resolved_prefix = end;
    }
    return join_range(results_, end);
}

std::string DecodeScheduler::drain_all() {
    std::unique_lock<std::mutex> lock(mu_);
    const uint64_t generation = generation_;
    const int64_t target = next_index_;

    cv_.wait(lock, [&] {
        return generation != generation_
               || static_cast<int64_t>(results_.size()) >= target;
    });

    if (generation != generation_) {
        FV_LOG_WARN("DecodeScheduler", "drain_all interrupted by cancel");
        return std::string();
    }
    return join_range(results_, target);
}

// ---------------------------------------------------------------------------
// reset / cancel / wait_idle
// ---------------------------------------------------------------------------

void DecodeScheduler::reset() {
    std::lock_guard<std::mutex> lock(mu_);
    ++generation_;
    results_.clear();
    next_index_ = 0;
    consecutive_failures_ = 0;
    failure_count_ = 0;
    cv_.notify_all();
}

void DecodeScheduler::cancel() {
    size_t dropped = pool_.clear();
    {
        std::lock_guard<std::mutex> lock(mu_);
        in_flight_ -= dropped;
        ++generation_;
        results_.clear();
        next_index_ = 0;
    }
    cv_.notify_all();
    if (dropped > 0) {
        FV_LOG_INFO("DecodeScheduler", "Cancelled " + std::to_string(dropped) + " queued decode(s)");
    }
}

void DecodeScheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return in_flight_ == 0; });
}

int64_t DecodeScheduler::submitted_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return next_index_;
}

int64_t DecodeScheduler::resolved_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int64_t>(results_.size());
}

int DecodeScheduler::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mu_);
    return consecutive_failures_;
}

int64_t DecodeScheduler::failure_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return failure_count_;
}

} // namespace fv
