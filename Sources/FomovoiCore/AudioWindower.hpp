#pragma once

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace fv {

/// Accumulates canonical PCM samples into fixed-length windows.
///
/// Window boundaries depend only on the number of samples accepted, never
/// on wall-clock time, so capture jitter cannot move a boundary.  Append
/// and extraction share one mutex: a window is never cut from a half
/// appended buffer.
class AudioWindower {
public:
    /// @param window_samples  Target window length in samples (> 0).
    /// @param sample_rate     Rate stamped onto produced windows.
    explicit AudioWindower(size_t window_samples,
                           int sample_rate = kCanonicalSampleRate);

    // Non-copyable.
    AudioWindower(const AudioWindower&) = delete;
    AudioWindower& operator=(const AudioWindower&) = delete;

    /// Append samples to the rolling buffer.
    void accept(const int16_t* samples, size_t count);
    void accept(const std::vector<int16_t>& samples);

    /// Append, then cut every full window now available.  Both steps happen
    /// under one lock.
    std::vector<Window> accept_and_extract(const std::vector<int16_t>& samples);

    /// Cut every full window currently buffered, in order.  Each has exactly
    /// window_samples() samples; the remainder stays buffered.
    std::vector<Window> extract_ready_windows();

    /// Hand out whatever remains as a tail window.  Returns nothing when
    /// the buffer is empty.
    std::optional<Window> flush();

    /// Drop buffered audio and restart sequence numbering at 0.
    void reset();

    size_t  window_samples() const { return window_samples_; }
    int     sample_rate() const { return sample_rate_; }
    size_t  buffered_samples() const;
    int64_t total_samples() const;
    int64_t next_sequence_index() const;

private:
    std::vector<Window> extract_locked();

    const size_t         window_samples_;
    const int            sample_rate_;

    std::vector<int16_t> buffer_;
    int64_t              next_index_ = 0;
    int64_t              total_samples_ = 0;
    mutable std::mutex   mu_;
};

} // namespace fv
