#include <cassert>
#include <cmath>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "AudioCapture.hpp"
#include "AudioConverter.hpp"
#include "Ids.hpp"

using namespace fv;

static void test_pcm_bytes_are_little_endian() {
    std::vector<uint8_t> bytes = {0x01, 0x00, 0xff, 0x7f, 0x00, 0x80, 0xff, 0xff};
    auto samples = AudioConverter::bytes_to_samples(bytes);
    assert((samples == std::vector<int16_t>{1, 32767, -32768, -1}));
    assert(AudioConverter::samples_to_bytes(samples.data(), samples.size()) == bytes);
    assert(AudioConverter::bytes_to_samples({}).empty());
}

static void test_odd_byte_count_is_rejected() {
    bool threw = false;
    try {
        AudioConverter::bytes_to_samples({1, 2, 3});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_rms_level() {
    assert(AudioCapture::compute_rms(nullptr, 0) == 0.0f);

    std::vector<int16_t> silence(160, 0);
    assert(AudioCapture::compute_rms(silence.data(), silence.size()) == 0.0f);

    std::vector<int16_t> square(160);
    for (size_t i = 0; i < square.size(); ++i) square[i] = (i % 2) ? 16384 : -16384;
    float level = AudioCapture::compute_rms(square.data(), square.size());
    assert(std::fabs(level - 0.5f) < 1e-4f);

    std::vector<int16_t> full(16, -32768);
    assert(AudioCapture::compute_rms(full.data(), full.size()) == 1.0f);
}

static void test_uuids_are_v4_and_distinct() {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_uuid();
        assert(id.size() == 36);
        assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
        assert(id[14] == '4');
        assert(std::string("89ab").find(id[19]) != std::string::npos);
        seen.insert(id);
    }
    assert(seen.size() == 100);
    assert(now_unix() > 1600000000);
}

int main() {
    test_pcm_bytes_are_little_endian();
    test_odd_byte_count_is_rejected();
    test_rms_level();
    test_uuids_are_v4_and_distinct();
    return 0;
}
