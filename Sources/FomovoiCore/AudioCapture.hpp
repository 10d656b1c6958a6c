#pragma once

#include "Types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace fv {

/// Captures the microphone through FFmpeg's libavdevice (ALSA on Linux,
/// AVFoundation on macOS) and delivers canonical PCM: mono, s16 little
/// endian, at the configured rate.
///
/// Buffers arrive on the capture thread in whatever period the device
/// uses; the consumer must not block for long.
class AudioCapture {
public:
    /// @param device       Device name; empty picks the platform default.
    /// @param sample_rate  Output rate of delivered PCM.
    explicit AudioCapture(std::string device = "", int sample_rate = kCanonicalSampleRate);
    ~AudioCapture();

    // Non-copyable.
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// Open the device and start the capture thread.
    /// @param pcm_cb    Receives each converted buffer.
    /// @param meter_cb  Receives the RMS level of each buffer.
    /// @return false if already capturing or the device cannot be opened.
    bool start(PcmCallback pcm_cb, MeteringCallback meter_cb = nullptr);

    /// Stop capturing and close the device.  Safe to call when idle.
    void stop();

    /// Current audio level in [0.0, 1.0].  Thread-safe.
    float get_metering() const;

    bool is_capturing() const;

    /// Samples delivered since start().
    int64_t samples_delivered() const;

    /// Platform input format name ("alsa" or "avfoundation").
    static const char* input_format_name();

    /// RMS of s16 samples, scaled to [0, 1].
    static float compute_rms(const int16_t* samples, size_t count);

private:
    void capture_loop();
    void close_device();

    std::string         device_;
    int                 sample_rate_;

    std::atomic<bool>   capturing_{false};
    std::thread         capture_thread_;
    std::mutex          mu_;

    PcmCallback         pcm_cb_;
    MeteringCallback    meter_cb_;

    std::atomic<float>  current_level_{0.0f};
    std::atomic<int64_t> samples_delivered_{0};

    // FFmpeg opaque handles, typed as void* to keep FFmpeg headers out of
    // the public interface.
    void* fmt_ctx_in_ = nullptr;   // AVFormatContext* (capture)
    void* dec_ctx_    = nullptr;   // AVCodecContext*  (raw PCM decoder)
    void* swr_ctx_    = nullptr;   // SwrContext*      (to mono s16)
    int   stream_idx_ = -1;
};

} // namespace fv
