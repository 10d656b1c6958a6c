#pragma once

#include "Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fv {

/// Converts audio into the canonical pipeline format (mono, signed 16-bit,
/// 16 kHz) using FFmpeg's libavformat / libavcodec / libswresample.
class AudioConverter {
public:
    AudioConverter();
    ~AudioConverter();

    // Non-copyable.
    AudioConverter(const AudioConverter&) = delete;
    AudioConverter& operator=(const AudioConverter&) = delete;

    /// Decode any FFmpeg-readable file to mono s16 PCM at the given rate.
    /// Throws std::runtime_error if the file cannot be opened or decoded.
    std::vector<int16_t> decode_file(const std::string& input_path,
                                     int target_sample_rate = kCanonicalSampleRate) const;

    /// Reinterpret little-endian s16 bytes as samples.  Throws
    /// std::invalid_argument on an odd byte count.
    static std::vector<int16_t> bytes_to_samples(const std::vector<uint8_t>& bytes);

    /// Inverse of bytes_to_samples().
    static std::vector<uint8_t> samples_to_bytes(const int16_t* samples, size_t count);
};

} // namespace fv
