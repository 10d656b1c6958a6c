#include "AudioCapture.hpp"
#include "AudioConverter.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

namespace fv {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioCapture::AudioCapture(std::string device, int sample_rate)
    : device_(std::move(device)), sample_rate_(sample_rate) {
    avdevice_register_all();
}

AudioCapture::~AudioCapture() {
    stop();
}

const char* AudioCapture::input_format_name() {
#ifdef __APPLE__
    return "avfoundation";
#else
    return "alsa";
#endif
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

bool AudioCapture::start(PcmCallback pcm_cb, MeteringCallback meter_cb) {
    std::lock_guard<std::mutex> lock(mu_);

    if (capturing_.load()) {
        return false;   // already capturing
    }

    pcm_cb_   = std::move(pcm_cb);
    meter_cb_ = std::move(meter_cb);
    samples_delivered_.store(0);

    const AVInputFormat* input_fmt = av_find_input_format(input_format_name());
    if (!input_fmt) {
        FV_LOG_ERROR("AudioCapture", std::string("Input format '") + input_format_name() + "' unavailable");
        return false;
    }

    std::string device = device_;
    if (device.empty()) {
#ifdef __APPLE__
        device = ":default";
#else
        device = "default";
#endif
    }

    AVDictionary* options = nullptr;
    av_dict_set(&options, "sample_rate", std::to_string(sample_rate_).c_str(), 0);
    av_dict_set(&options, "channels", "1", 0);

    AVFormatContext* ifmt_ctx = nullptr;
    int ret = avformat_open_input(&ifmt_ctx, device.c_str(), input_fmt, &options);
    av_dict_free(&options);
    if (ret < 0) {
        char errbuf[256];
        av_strerror(ret, errbuf, sizeof(errbuf));
        FV_LOG_ERROR("AudioCapture", "Cannot open capture device '" + device + "': " + errbuf);
        return false;
    }

    ret = avformat_find_stream_info(ifmt_ctx, nullptr);
    if (ret < 0) { avformat_close_input(&ifmt_ctx); return false; }

    int idx = av_find_best_stream(ifmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (idx < 0) { avformat_close_input(&ifmt_ctx); return false; }
    AVStream* stream = ifmt_ctx->streams[idx];

    // Capture devices hand out raw PCM packets; a decoder turns them into
    // frames whatever the sample format is.
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) { avformat_close_input(&ifmt_ctx); return false; }
    AVCodecContext* dec_ctx = avcodec_alloc_context3(decoder);
    avcodec_parameters_to_context(dec_ctx, stream->codecpar);
    if (avcodec_open2(dec_ctx, decoder, nullptr) < 0) {
        avcodec_free_context(&dec_ctx);
        avformat_close_input(&ifmt_ctx);
        return false;
    }

    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* swr = nullptr;
    ret = swr_alloc_set_opts2(&swr,
        &out_layout, AV_SAMPLE_FMT_S16, sample_rate_,
        &dec_ctx->ch_layout, dec_ctx->sample_fmt, dec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(swr) < 0) {
        if (swr) swr_free(&swr);
        avcodec_free_context(&dec_ctx);
        avformat_close_input(&ifmt_ctx);
        FV_LOG_ERROR("AudioCapture", "Failed to initialize capture resampler");
        return false;
    }

    fmt_ctx_in_ = ifmt_ctx;
    dec_ctx_    = dec_ctx;
    swr_ctx_    = swr;
    stream_idx_ = idx;

    FV_LOG_INFO("AudioCapture", "Capturing from " + std::string(input_format_name()) + ":" + device
                + " (" + std::to_string(dec_ctx->sample_rate) + " Hz -> "
                + std::to_string(sample_rate_) + " Hz mono)");

    capturing_.store(true);
    capture_thread_ = std::thread(&AudioCapture::capture_loop, this);
    return true;
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

void AudioCapture::stop() {
    if (!capturing_.exchange(false)) {
        return;
    }

    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mu_);
    close_device();
    current_level_.store(0.0f);
    FV_LOG_INFO("AudioCapture", "Capture stopped after " + std::to_string(samples_delivered_.load()) + " samples");
}

void AudioCapture::close_device() {
    if (swr_ctx_) {
        SwrContext* swr = reinterpret_cast<SwrContext*>(swr_ctx_);
        swr_free(&swr);
        swr_ctx_ = nullptr;
    }
    if (dec_ctx_) {
        AVCodecContext* dec = reinterpret_cast<AVCodecContext*>(dec_ctx_);
        avcodec_free_context(&dec);
        dec_ctx_ = nullptr;
    }
    if (fmt_ctx_in_) {
        avformat_close_input(reinterpret_cast<AVFormatContext**>(&fmt_ctx_in_));
        fmt_ctx_in_ = nullptr;
    }
    stream_idx_ = -1;
}

// ---------------------------------------------------------------------------
// get_metering / is_capturing / samples_delivered
// ---------------------------------------------------------------------------

float AudioCapture::get_metering() const {
    return current_level_.load();
}

bool AudioCapture::is_capturing() const {
    return capturing_.load();
}

int64_t AudioCapture::samples_delivered() const {
    return samples_delivered_.load();
}

// ---------------------------------------------------------------------------
// capture_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void AudioCapture::capture_loop() {
    AVFormatContext* ifmt = reinterpret_cast<AVFormatContext*>(fmt_ctx_in_);
    AVCodecContext* dec = reinterpret_cast<AVCodecContext*>(dec_ctx_);
    SwrContext* swr = reinterpret_cast<SwrContext*>(swr_ctx_);

    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();
    std::vector<int16_t> buf;

    while (capturing_.load()) {
        int ret = av_read_frame(ifmt, pkt);
        if (ret < 0) {
            if (ret == AVERROR_EOF) {
                FV_LOG_WARN("AudioCapture", "Capture device reported end of stream");
                break;
            }
            continue;
        }
        if (pkt->stream_index != stream_idx_) {
            av_packet_unref(pkt);
            continue;
        }

        avcodec_send_packet(dec, pkt);
        av_packet_unref(pkt);

        while (avcodec_receive_frame(dec, frame) == 0) {
            int out_samples = static_cast<int>(av_rescale_rnd(
                swr_get_delay(swr, dec->sample_rate) + frame->nb_samples,
                sample_rate_, dec->sample_rate, AV_ROUND_UP));
            buf.resize(static_cast<size_t>(out_samples));
            uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
            int converted = swr_convert(swr, &out_buf, out_samples,
                                        (const uint8_t**)frame->extended_data,
                                        frame->nb_samples);
            if (converted <= 0) continue;

            float level = compute_rms(buf.data(), static_cast<size_t>(converted));
            current_level_.store(level);
            if (meter_cb_) meter_cb_(level);

            samples_delivered_ += converted;
            if (pcm_cb_) {
                pcm_cb_(AudioConverter::samples_to_bytes(buf.data(), static_cast<size_t>(converted)));
            }
        }
    }

    av_frame_free(&frame);
    av_packet_free(&pkt);
}

// ---------------------------------------------------------------------------
// compute_rms
// ---------------------------------------------------------------------------

float AudioCapture::compute_rms(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        double s = static_cast<double>(samples[i]) / 32768.0;
        sum += s * s;
    }
    float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));

    // Clamp to [0, 1].
    return std::min(1.0f, std::max(0.0f, rms));
}

} // namespace fv
