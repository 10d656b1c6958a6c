#pragma once

#include "Types.hpp"
#include "WorkerPool.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace fv {

/// Runs one decode task per window on a worker pool and reassembles the
/// results in window order.
///
/// Tasks may finish in any order.  Each result lands in a slot keyed by its
/// sequence index; slots are only ever added during a session, so readers
/// see a growing, gap-aware view.  A decode that throws resolves to empty
/// text and is logged, never rethrown.
class DecodeScheduler {
public:
    using DecodeFn = std::function<std::string(const Window&)>;

    /// Fired on a worker thread after slot `index` is written.
    using CompletionCallback = std::function<void(int64_t index, const std::string& text)>;

    explicit DecodeScheduler(DecodeFn decode, size_t num_workers = 2);
    ~DecodeScheduler();

    // Non-copyable.
    DecodeScheduler(const DecodeScheduler&) = delete;
    DecodeScheduler& operator=(const DecodeScheduler&) = delete;

    /// Swap the decode function.  Only valid while nothing is in flight.
    void set_decoder(DecodeFn decode);

    void set_completion_callback(CompletionCallback cb);

    /// Assign the next sequence index to `window` and queue its decode.
    /// Never blocks on decoding.  Returns the assigned index.
    int64_t submit(Window window);

    /// Longest gap-free run of resolved results from index 0, non-empty
    /// texts joined with a single space.  `resolved_prefix` receives the
    /// run length.
    std::string poll_ordered_prefix(int64_t* resolved_prefix = nullptr) const;

    /// Block until every submitted index has resolved, then return the full
    /// ordered concatenation.  Returns early (with what has resolved) if
    /// cancel() is called meanwhile.
    std::string drain_all();

    /// Clear results and restart numbering at 0.  Call between sessions.
    void reset();

    /// Abrupt exit: drop queued tasks, discard all results, and make any
    /// running task's result land nowhere.  Wakes drain_all().
    void cancel();

    /// Wait until no task (queued or running, from any generation) remains.
    void wait_idle();

    int64_t submitted_count() const;
    int64_t resolved_count() const;
    int     consecutive_failures() const;
    int64_t failure_count() const;

private:
    void run_task(uint64_t generation, const Window& window);

    DecodeFn                    decode_;
    CompletionCallback          on_complete_;

    std::map<int64_t, std::string> results_;   // index -> text, append-only per generation
    int64_t                     next_index_ = 0;
    uint64_t                    generation_ = 0;
    size_t                      in_flight_ = 0;
    int                         consecutive_failures_ = 0;
    int64_t                     failure_count_ = 0;

    mutable std::mutex          mu_;
    std::condition_variable     cv_;

    WorkerPool                  pool_;        // last: joined before the rest is destroyed
};

} // namespace fv
