#include "WhisperEngine.hpp"
#include "Logger.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "whisper.h"

namespace fv {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

/// State shared with whisper's abort callback for one decode.
struct AbortCtx {
    const std::atomic<bool>*              cancelled;
    std::chrono::steady_clock::time_point deadline;
    bool                                  has_deadline;
};

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperEngine::WhisperEngine() = default;

WhisperEngine::~WhisperEngine() {
    release();
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------

void WhisperEngine::initialize(const ModelBundle& bundle,
                               const std::string& bundle_dir,
                               const EngineOptions& options) {
    std::unique_lock<std::shared_mutex> lock(mu_);

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }

    std::string model_path;
    for (const auto& f : bundle.files) {
        if (std::filesystem::path(f.name).extension() == ".bin") {
            model_path = (std::filesystem::path(bundle_dir) / f.name).string();
            break;
        }
    }
    if (model_path.empty()) {
        throw std::runtime_error("bundle " + bundle.id + " has no ggml model file");
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    ctx_ = whisper_init_from_file_with_params_no_state(model_path.c_str(), cparams);
    if (!ctx_) {
        throw std::runtime_error("whisper could not load " + model_path);
    }

    options_ = options;
    // English-only checkpoints ignore hints and cannot translate.
    if (bundle.language == SpeechLanguage::english) {
        options_.language  = "en";
        options_.translate = false;
    }
    cancelled_.store(false);

    FV_LOG_INFO("WhisperEngine", "Loaded " + bundle.display_name() + " from " + model_path
                + " (language '" + (options_.language.empty() ? "auto" : options_.language)
                + "', task " + (options_.translate ? "translate" : "transcribe") + ")");
}

// ---------------------------------------------------------------------------
// decode_window
// ---------------------------------------------------------------------------

std::string WhisperEngine::decode_window(const Window& window) {
    std::shared_lock<std::shared_mutex> lock(mu_);

    if (!ctx_) {
        throw std::runtime_error("whisper model not loaded");
    }
    if (window.samples.empty()) {
        return "";
    }

    std::vector<float> pcm(window.samples.size());
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = static_cast<float>(window.samples[i]) / 32768.0f;
    }

    struct whisper_state* state = whisper_init_state(ctx_);
    if (!state) {
        throw std::runtime_error("whisper_init_state failed");
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_timestamps = false;
    params.print_special    = false;
    params.single_segment   = false;
    params.no_context       = true;
    params.language         = options_.language.empty() ? "auto" : options_.language.c_str();
    params.translate        = options_.translate;
    params.n_threads        = options_.threads;

    AbortCtx abort_ctx{&cancelled_, {}, options_.decode_timeout_ms > 0};
    if (abort_ctx.has_deadline) {
        abort_ctx.deadline = std::chrono::steady_clock::now()
                             + std::chrono::milliseconds(options_.decode_timeout_ms);
    }
    params.abort_callback = [](void* user_data) -> bool {
        auto* c = static_cast<AbortCtx*>(user_data);
        if (c->cancelled->load()) return true;
        return c->has_deadline && std::chrono::steady_clock::now() > c->deadline;
    };
    params.abort_callback_user_data = &abort_ctx;

    int ret = whisper_full_with_state(ctx_, state, params, pcm.data(),
                                      static_cast<int>(pcm.size()));
    if (ret != 0) {
        whisper_free_state(state);
        if (cancelled_.load()) {
            throw std::runtime_error("decode cancelled");
        }
        throw std::runtime_error("whisper_full_with_state failed (" + std::to_string(ret) + ")");
    }

    std::string result;
    int n_segments = whisper_full_n_segments_from_state(state);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text_from_state(state, i);
        if (text) {
            result += text;
        }
    }
    whisper_free_state(state);

    return trim(result);
}

// ---------------------------------------------------------------------------
// release / is_loaded / window_seconds
// ---------------------------------------------------------------------------

void WhisperEngine::release() {
    // Running decodes see the flag in their abort callback and unwind,
    // releasing the shared lock.
    cancelled_.store(true);

    std::unique_lock<std::shared_mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
        FV_LOG_DEBUG("WhisperEngine", "Model released");
    }
}

bool WhisperEngine::is_loaded() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return ctx_ != nullptr;
}

int WhisperEngine::window_seconds() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return options_.window_seconds;
}

} // namespace fv
