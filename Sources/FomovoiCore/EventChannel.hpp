#pragma once

#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace fv {

/// Bounded outbound queue of TranscriptionEvents.
/// Producers (decode workers, the session) never block.  When the queue is
/// full the oldest PartialResult is discarded first, since any later partial
/// supersedes it; only if none is queued does the oldest event go.
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 64);

    // Non-copyable.
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// Enqueue.  Returns false if the channel is closed.
    bool push(TranscriptionEvent event);

    /// Wait up to `timeout` for an event.  Returns false on timeout or when
    /// the channel is closed and empty.
    bool pop(TranscriptionEvent& out, std::chrono::milliseconds timeout);

    bool try_pop(TranscriptionEvent& out);

    /// Take everything queued right now.
    std::vector<TranscriptionEvent> drain();

    /// Wake all waiting consumers; later pushes are refused.
    void close();
    void reopen();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dropped_count() const { return dropped_count_.load(); }
    bool   closed() const;

private:
    const size_t                   capacity_;
    std::deque<TranscriptionEvent> queue_;
    mutable std::mutex             mu_;
    std::condition_variable        cv_;
    bool                           closed_ = false;
    std::atomic<size_t>            dropped_count_{0};
};

} // namespace fv
