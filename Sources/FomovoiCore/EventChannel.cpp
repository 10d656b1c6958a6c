#include "EventChannel.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <iterator>

namespace fv {

EventChannel::EventChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool EventChannel::push(TranscriptionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) {
            return false;
        }

        if (queue_.size() >= capacity_) {
            auto it = std::find_if(queue_.begin(), queue_.end(), [](const TranscriptionEvent& e) {
                return e.kind == TranscriptionEvent::Kind::partial_result;
            });
            if (it != queue_.end()) {
                queue_.erase(it);
            } else {
                FV_LOG_WARN("EventChannel", "Queue full, dropping oldest non-partial event");
                queue_.pop_front();
            }
            dropped_count_++;
        }

        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

bool EventChannel::pop(TranscriptionEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool EventChannel::try_pop(TranscriptionEvent& out) {
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::vector<TranscriptionEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<TranscriptionEvent> out(std::make_move_iterator(queue_.begin()),
                                        std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

void EventChannel::reopen() {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = false;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

} // namespace fv
