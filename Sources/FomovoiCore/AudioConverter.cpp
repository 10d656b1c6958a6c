#include "AudioConverter.hpp"
#include "Logger.hpp"

#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

namespace fv {

namespace {

std::string av_error_string(int err) {
    char errbuf[256];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

/// Run one decoded frame (or a resampler flush when frame is null) through
/// swr and append the s16 output.
void convert_into(SwrContext* swr, const AVFrame* frame, int in_rate, int out_rate,
                  std::vector<int16_t>& out) {
    int in_samples = frame ? frame->nb_samples : 0;
    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, in_rate) + in_samples, out_rate, in_rate, AV_ROUND_UP));
    if (out_samples <= 0) return;

    std::vector<int16_t> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr, &out_buf, out_samples,
                                frame ? (const uint8_t**)frame->extended_data : nullptr,
                                in_samples);
    if (converted > 0) {
        out.insert(out.end(), buf.begin(), buf.begin() + converted);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioConverter::AudioConverter() = default;
AudioConverter::~AudioConverter() = default;

// ---------------------------------------------------------------------------
// decode_file
// ---------------------------------------------------------------------------

std::vector<int16_t> AudioConverter::decode_file(const std::string& input_path,
                                                 int target_sample_rate) const {
    std::vector<int16_t> pcm_out;

    // 1. Open input file
    AVFormatContext* fmt_ctx = nullptr;
    int ret = avformat_open_input(&fmt_ctx, input_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw std::runtime_error("Failed to open audio file '" + input_path + "': " + av_error_string(ret));
    }

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0) { avformat_close_input(&fmt_ctx); throw std::runtime_error("Failed to find stream info in audio file"); }

    // 2. Find the audio stream
    int audio_idx = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) { avformat_close_input(&fmt_ctx); throw std::runtime_error("No audio stream found in file"); }

    AVStream* stream = fmt_ctx->streams[audio_idx];

    // 3. Open decoder
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) { avformat_close_input(&fmt_ctx); throw std::runtime_error("No decoder found for audio codec"); }
    AVCodecContext* dec_ctx = avcodec_alloc_context3(decoder);
    avcodec_parameters_to_context(dec_ctx, stream->codecpar);
    ret = avcodec_open2(dec_ctx, decoder, nullptr);
    if (ret < 0) {
        avcodec_free_context(&dec_ctx);
        avformat_close_input(&fmt_ctx);
        throw std::runtime_error("Failed to open audio decoder");
    }

    // 4. Resampler to mono s16 at the target rate
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* swr = nullptr;
    ret = swr_alloc_set_opts2(&swr,
        &out_layout, AV_SAMPLE_FMT_S16, target_sample_rate,
        &dec_ctx->ch_layout, dec_ctx->sample_fmt, dec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(swr) < 0) {
        avcodec_free_context(&dec_ctx);
        avformat_close_input(&fmt_ctx);
        if (swr) swr_free(&swr);
        throw std::runtime_error("Failed to initialize audio resampler");
    }

    const int in_rate = dec_ctx->sample_rate;

    // 5. Read packets, decode frames, resample
    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();
    while (av_read_frame(fmt_ctx, pkt) >= 0) {
        if (pkt->stream_index != audio_idx) {
            av_packet_unref(pkt);
            continue;
        }
        if (avcodec_send_packet(dec_ctx, pkt) < 0) {
            FV_LOG_DEBUG("AudioConverter", "Skipping undecodable packet in " + input_path);
        }
        while (avcodec_receive_frame(dec_ctx, frame) == 0) {
            convert_into(swr, frame, in_rate, target_sample_rate, pcm_out);
        }
        av_packet_unref(pkt);
    }

    // 6. Flush decoder, then resampler
    avcodec_send_packet(dec_ctx, nullptr);
    while (avcodec_receive_frame(dec_ctx, frame) == 0) {
        convert_into(swr, frame, in_rate, target_sample_rate, pcm_out);
    }
    convert_into(swr, nullptr, in_rate, target_sample_rate, pcm_out);

    // 7. Cleanup
    av_frame_free(&frame);
    av_packet_free(&pkt);
    swr_free(&swr);
    avcodec_free_context(&dec_ctx);
    avformat_close_input(&fmt_ctx);

    FV_LOG_DEBUG("AudioConverter", "Decoded " + input_path + ": "
                 + std::to_string(pcm_out.size()) + " samples @ " + std::to_string(target_sample_rate) + " Hz");
    return pcm_out;
}

// ---------------------------------------------------------------------------
// Byte <-> sample helpers  (static)
// ---------------------------------------------------------------------------

std::vector<int16_t> AudioConverter::bytes_to_samples(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 2 != 0) {
        throw std::invalid_argument("PCM buffer has odd length " + std::to_string(bytes.size()));
    }
    std::vector<int16_t> samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t lo = bytes[2 * i];
        uint16_t hi = bytes[2 * i + 1];
        samples[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return samples;
}

std::vector<uint8_t> AudioConverter::samples_to_bytes(const int16_t* samples, size_t count) {
    std::vector<uint8_t> bytes(count * 2);
    for (size_t i = 0; i < count; ++i) {
        auto v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i]     = static_cast<uint8_t>(v & 0xff);
        bytes[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
    return bytes;
}

} // namespace fv
