#include "AudioWindower.hpp"
#include "Logger.hpp"

#include <stdexcept>

namespace fv {

AudioWindower::AudioWindower(size_t window_samples, int sample_rate)
    : window_samples_(window_samples), sample_rate_(sample_rate) {
    if (window_samples_ == 0) {
        throw std::invalid_argument("AudioWindower: window length must be positive");
    }
    buffer_.reserve(window_samples_);
}

void AudioWindower::accept(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return;
    std::lock_guard<std::mutex> lock(mu_);
    buffer_.insert(buffer_.end(), samples, samples + count);
    total_samples_ += static_cast<int64_t>(count);
}

void AudioWindower::accept(const std::vector<int16_t>& samples) {
    accept(samples.data(), samples.size());
}

std::vector<Window> AudioWindower::accept_and_extract(const std::vector<int16_t>& samples) {
    std::lock_guard<std::mutex> lock(mu_);
    buffer_.insert(buffer_.end(), samples.begin(), samples.end());
    total_samples_ += static_cast<int64_t>(samples.size());
    return extract_locked();
}

std::vector<Window> AudioWindower::extract_ready_windows() {
    std::lock_guard<std::mutex> lock(mu_);
    return extract_locked();
}

std::vector<Window> AudioWindower::extract_locked() {
    std::vector<Window> out;
    size_t offset = 0;
    while (buffer_.size() - offset >= window_samples_) {
        Window w;
        w.sequence_index = next_index_++;
        w.sample_rate    = sample_rate_;
        w.samples.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(offset),
                         buffer_.begin() + static_cast<std::ptrdiff_t>(offset + window_samples_));
        offset += window_samples_;
        out.push_back(std::move(w));
    }
    if (offset > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
        FV_LOG_DEBUG("AudioWindower", "Cut " + std::to_string(out.size()) + " window(s), "
                     + std::to_string(buffer_.size()) + " samples remain");
    }
    return out;
}

std::optional<Window> AudioWindower::flush() {
    std::lock_guard<std::mutex> lock(mu_);
    if (buffer_.empty()) return std::nullopt;

    Window w;
    w.sequence_index = next_index_++;
    w.sample_rate    = sample_rate_;
    w.is_tail        = buffer_.size() < window_samples_;
    w.samples.swap(buffer_);
    buffer_.clear();
    buffer_.reserve(window_samples_);
    return w;
}

void AudioWindower::reset() {
    std::lock_guard<std::mutex> lock(mu_);
    buffer_.clear();
    next_index_ = 0;
    total_samples_ = 0;
}

size_t AudioWindower::buffered_samples() const {
    std::lock_guard<std::mutex> lock(mu_);
    return buffer_.size();
}

int64_t AudioWindower::total_samples() const {
    std::lock_guard<std::mutex> lock(mu_);
    return total_samples_;
}

int64_t AudioWindower::next_sequence_index() const {
    std::lock_guard<std::mutex> lock(mu_);
    return next_index_;
}

} // namespace fv
