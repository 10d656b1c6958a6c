#include "TranscriptionSession.hpp"
#include "AssetStore.hpp"
#include "AudioConverter.hpp"
#include "Ids.hpp"
#include "Logger.hpp"
#include "SettingsStore.hpp"

#include <exception>
#include <stdexcept>

namespace fv {

namespace {

constexpr const char* kTag = "TranscriptionSession";
constexpr const char* kNoModelMessage = "No model available. Please download a model.";

} // namespace

SessionOptions session_options_from_config(const AppConfig& cfg) {
    SessionOptions o;
    o.sample_rate              = cfg.sample_rate;
    o.scheduler_workers        = cfg.scheduler_workers > 0 ? static_cast<size_t>(cfg.scheduler_workers) : 1;
    o.event_capacity           = cfg.event_capacity > 0 ? static_cast<size_t>(cfg.event_capacity) : 1;
    o.engine.threads           = cfg.engine_threads;
    o.engine.window_seconds    = cfg.window_seconds;
    o.engine.decode_timeout_ms = cfg.decode_timeout_ms;
    return o;
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TranscriptionSession::TranscriptionSession(AssetStore& assets, SettingsStore* settings,
                                           EngineFactory factory, SessionOptions options)
    : assets_(assets),
      settings_(settings),
      factory_(std::move(factory)),
      options_(options),
      events_(options.event_capacity),
      scheduler_(nullptr, options.scheduler_workers) {
    if (settings_) {
        language_hint_ = settings_->get(SettingsStore::kLanguageHint).value_or("");
        translate_ = settings_->get_bool(SettingsStore::kTranslateToEnglish, false);
    }
    scheduler_.set_completion_callback([this](int64_t, const std::string&) {
        on_window_decoded();
    });
}

TranscriptionSession::~TranscriptionSession() {
    {
        std::lock_guard<std::mutex> lock(op_mu_);
        release_locked();
    }
    events_.close();
}

// ---------------------------------------------------------------------------
// Observation
// ---------------------------------------------------------------------------

void TranscriptionSession::set_state_callback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(op_mu_);
    state_cb_ = std::move(cb);
}

std::optional<ModelBundle> TranscriptionSession::current_bundle() const {
    std::lock_guard<std::mutex> lock(info_mu_);
    return bundle_;
}

SpeechLanguage TranscriptionSession::current_language() const {
    std::lock_guard<std::mutex> lock(info_mu_);
    return language_;
}

std::optional<Speaker> TranscriptionSession::current_speaker() const {
    std::lock_guard<std::mutex> lock(info_mu_);
    return current_speaker_;
}

std::string TranscriptionSession::language_hint() const {
    std::lock_guard<std::mutex> lock(info_mu_);
    return language_hint_;
}

bool TranscriptionSession::translate_to_english() const {
    std::lock_guard<std::mutex> lock(info_mu_);
    return translate_;
}

int64_t TranscriptionSession::windows_submitted() const {
    return scheduler_.submitted_count();
}

void TranscriptionSession::set_state(SessionState s) {
    SessionState prev = state_.exchange(s);
    if (prev == s) return;
    FV_LOG_DEBUG(kTag, std::string("State ") + state_to_string(prev) + " -> " + state_to_string(s));
    if (state_cb_) state_cb_(s);
}

void TranscriptionSession::emit(TranscriptionEvent event) {
    if (!events_.push(std::move(event))) {
        FV_LOG_DEBUG(kTag, "Event dropped: channel closed");
    }
}

void TranscriptionSession::fail(const std::string& message) {
    FV_LOG_ERROR(kTag, message);
    set_state(SessionState::error);
    emit(TranscriptionEvent::failure(message));
}

// ---------------------------------------------------------------------------
// Engine construction
// ---------------------------------------------------------------------------

EngineOptions TranscriptionSession::engine_options_for(const ModelBundle& bundle) const {
    EngineOptions o = options_.engine;
    std::lock_guard<std::mutex> lock(info_mu_);
    if (bundle.language == SpeechLanguage::english) {
        o.language = "en";
        o.translate = false;
    } else {
        o.language = language_hint_;
        o.translate = translate_;
    }
    return o;
}

void TranscriptionSession::load_bundle(const ModelBundle& bundle) {
    if (!factory_) {
        throw std::runtime_error("no recognition engine configured");
    }
    if (!assets_.is_complete(bundle)) {
        throw std::runtime_error("Model not downloaded: " + bundle.display_name());
    }

    // Drop the old engine first; two loaded models may not fit in memory.
    // No decode may still hold its pointer when it goes.
    accepting_.store(false);
    scheduler_.cancel();
    if (engine_) {
        engine_->release();
    }
    scheduler_.wait_idle();
    scheduler_.set_decoder(nullptr);
    engine_.reset();

    std::unique_ptr<RecognitionEngine> engine = factory_();
    if (!engine) {
        throw std::runtime_error("engine factory returned no engine");
    }
    engine->initialize(bundle, assets_.bundle_dir(bundle).string(), engine_options_for(bundle));

    int window_seconds = engine->window_seconds();
    if (window_seconds <= 0) {
        throw std::runtime_error("engine reported a non-positive window length");
    }
    windower_ = std::make_unique<AudioWindower>(
        static_cast<size_t>(window_seconds) * static_cast<size_t>(options_.sample_rate),
        options_.sample_rate);

    engine_ = std::move(engine);
    RecognitionEngine* raw = engine_.get();
    scheduler_.set_decoder([raw](const Window& w) { return raw->decode_window(w); });

    Speaker speaker = default_speaker();
    {
        std::lock_guard<std::mutex> lock(info_mu_);
        bundle_ = bundle;
        language_ = bundle.language;
        speakers_.clear();
        speakers_[speaker.id] = speaker;
        current_speaker_ = speaker;
    }

    FV_LOG_INFO(kTag, "Engine ready: " + bundle.display_name() + ", "
                + std::to_string(window_seconds) + " s windows");
}

bool TranscriptionSession::reload_locked(const ModelBundle& bundle, const char* failure_prefix) {
    if (state_.load() == SessionState::transcribing) {
        stop_locked();
    }

    set_state(SessionState::initializing);
    try {
        load_bundle(bundle);
    } catch (const std::exception& e) {
        fail(std::string(failure_prefix) + e.what());
        return false;
    }
    set_state(SessionState::ready);
    return true;
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------

bool TranscriptionSession::initialize() {
    std::lock_guard<std::mutex> lock(op_mu_);
    idle_error_reported_ = false;

    if (state_.load() == SessionState::transcribing) {
        stop_locked();
    }
    set_state(SessionState::initializing);

    try {
        std::optional<ModelBundle> bundle = assets_.selected();
        if (!bundle) {
            FV_LOG_WARN(kTag, "No model selected, checking for downloaded models...");
            bundle = assets_.smallest_complete();
            if (bundle) {
                FV_LOG_INFO(kTag, "Found downloaded model: " + bundle->display_name());
                if (!assets_.select(*bundle)) {
                    FV_LOG_WARN(kTag, "Could not persist selection of " + bundle->id);
                }
            }
        }
        if (!bundle) {
            fail(kNoModelMessage);
            return false;
        }

        load_bundle(*bundle);
    } catch (const std::exception& e) {
        fail(std::string("Failed to initialize: ") + e.what());
        return false;
    }

    set_state(SessionState::ready);
    return true;
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

bool TranscriptionSession::start() {
    std::lock_guard<std::mutex> lock(op_mu_);

    SessionState s = state_.load();
    if (s == SessionState::transcribing) {
        FV_LOG_WARN(kTag, "start() ignored: already transcribing");
        return true;
    }
    if (s != SessionState::ready || !engine_ || !windower_) {
        FV_LOG_WARN(kTag, std::string("Cannot start transcription in state: ") + state_to_string(s));
        if (s == SessionState::idle && !idle_error_reported_) {
            idle_error_reported_ = true;
            emit(TranscriptionEvent::failure(kNoModelMessage));
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> audio_lock(audio_mu_);
        windower_->reset();
        scheduler_.reset();
        {
            std::lock_guard<std::mutex> plock(partial_mu_);
            last_prefix_count_ = 0;
            last_partial_.clear();
        }
        started_at_ = std::chrono::steady_clock::now();
        accepting_.store(true);
    }

    set_state(SessionState::transcribing);
    FV_LOG_INFO(kTag, "Transcription started");
    return true;
}

// ---------------------------------------------------------------------------
// accept_audio
// ---------------------------------------------------------------------------

void TranscriptionSession::accept_audio(const std::vector<uint8_t>& pcm_bytes) {
    if (!accepting_.load()) return;

    std::vector<int16_t> samples;
    try {
        samples = AudioConverter::bytes_to_samples(pcm_bytes);
    } catch (const std::invalid_argument& e) {
        FV_LOG_WARN(kTag, std::string("Dropping malformed PCM buffer: ") + e.what());
        return;
    }
    accept_samples(samples);
}

void TranscriptionSession::accept_samples(const std::vector<int16_t>& samples) {
    if (!accepting_.load() || samples.empty()) return;

    try {
        accept_locked(samples);
    } catch (const std::exception& e) {
        fail(std::string("Transcription failed: ") + e.what());
        accepting_.store(false);
    }
}

void TranscriptionSession::accept_locked(const std::vector<int16_t>& samples) {
    std::lock_guard<std::mutex> lock(audio_mu_);
    if (!accepting_.load() || !windower_) return;

    for (auto& window : windower_->accept_and_extract(samples)) {
        int64_t index = scheduler_.submit(std::move(window));
        FV_LOG_DEBUG(kTag, "Window " + std::to_string(index) + " submitted");
    }
}

void TranscriptionSession::on_window_decoded() {
    int64_t count = 0;
    std::string prefix = scheduler_.poll_ordered_prefix(&count);

    std::lock_guard<std::mutex> lock(partial_mu_);
    if (count <= last_prefix_count_) return;
    last_prefix_count_ = count;

    if (prefix.empty() || prefix == last_partial_) return;
    last_partial_ = prefix;
    emit(TranscriptionEvent::partial(prefix));
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

std::optional<TranscriptionResult> TranscriptionSession::stop() {
    std::lock_guard<std::mutex> lock(op_mu_);
    return stop_locked();
}

std::optional<TranscriptionResult> TranscriptionSession::stop_locked() {
    if (state_.load() != SessionState::transcribing) {
        FV_LOG_WARN(kTag, std::string("stop() ignored in state: ") + state_to_string(state_.load()));
        return std::nullopt;
    }

    try {
        int64_t total_samples = 0;
        {
            std::lock_guard<std::mutex> audio_lock(audio_mu_);
            accepting_.store(false);
            for (auto& window : windower_->extract_ready_windows()) {
                scheduler_.submit(std::move(window));
            }
            if (auto tail = windower_->flush()) {
                FV_LOG_DEBUG(kTag, "Submitting tail window (" + std::to_string(tail->duration_ms()) + " ms)");
                scheduler_.submit(std::move(*tail));
            }
            total_samples = windower_->total_samples();
        }

        FV_LOG_INFO(kTag, "Stopping, waiting for " + std::to_string(scheduler_.submitted_count())
                    + " window(s) to decode");
        std::string text = scheduler_.drain_all();
        scheduler_.wait_idle();   // partial emission for the last window has run

        set_state(SessionState::ready);

        if (text.empty()) {
            FV_LOG_INFO(kTag, "No speech recognized");
            return std::nullopt;
        }

        const int64_t duration_ms = options_.sample_rate > 0
                                        ? total_samples * 1000 / options_.sample_rate
                                        : 0;

        Utterance utterance;
        utterance.id = generate_uuid();
        utterance.text = text;
        utterance.speaker = current_speaker().value_or(default_speaker());
        utterance.start_ms = 0;
        utterance.end_ms = duration_ms;

        TranscriptionResult result;
        result.id = generate_uuid();
        result.utterances.push_back(utterance);
        result.full_text = text;
        result.duration_ms = duration_ms;
        result.created_at = now_unix();
        result.is_complete = true;

        auto wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_).count();
        FV_LOG_INFO(kTag, "Transcription complete: " + std::to_string(text.size()) + " chars, "
                    + std::to_string(duration_ms) + " ms of audio in " + std::to_string(wall_ms) + " ms");

        emit(TranscriptionEvent::final_result(utterance));
        return result;
    } catch (const std::exception& e) {
        fail(std::string("Transcription failed: ") + e.what());
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// release
// ---------------------------------------------------------------------------

void TranscriptionSession::release() {
    std::lock_guard<std::mutex> lock(op_mu_);
    release_locked();
}

void TranscriptionSession::release_locked() {
    accepting_.store(false);

    // Queued decodes are dropped and running ones land nowhere; the engine
    // flag then aborts work inside the model.
    scheduler_.cancel();
    if (engine_) {
        engine_->release();
    }
    scheduler_.wait_idle();
    scheduler_.set_decoder(nullptr);
    engine_.reset();

    {
        std::lock_guard<std::mutex> audio_lock(audio_mu_);
        if (windower_) windower_->reset();
    }
    {
        std::lock_guard<std::mutex> info_lock(info_mu_);
        bundle_.reset();
    }

    if (state_.load() != SessionState::idle) {
        FV_LOG_INFO(kTag, "Session released");
        idle_error_reported_ = false;
    }
    set_state(SessionState::idle);
}

// ---------------------------------------------------------------------------
// Reconfiguration
// ---------------------------------------------------------------------------

bool TranscriptionSession::set_language(SpeechLanguage language) {
    std::lock_guard<std::mutex> lock(op_mu_);

    auto bundle = assets_.smallest_complete(language);
    if (!bundle) {
        emit(TranscriptionEvent::failure(std::string("No ") + language_display_name(language)
                                         + " model downloaded"));
        return false;
    }

    FV_LOG_INFO(kTag, std::string("Switching to model for ") + language_display_name(language)
                + ": " + bundle->display_name());
    if (!assets_.select(*bundle)) {
        FV_LOG_WARN(kTag, "Could not persist selection of " + bundle->id);
    }
    return reload_locked(*bundle, "Failed to switch model: ");
}

bool TranscriptionSession::set_language_hint(const std::string& code) {
    std::lock_guard<std::mutex> lock(op_mu_);

    if (!find_language_hint(code)) {
        FV_LOG_WARN(kTag, "Unknown language hint '" + code + "'");
        return false;
    }
    {
        std::lock_guard<std::mutex> info_lock(info_mu_);
        if (language_hint_ == code) return true;
        language_hint_ = code;
    }
    if (settings_ && !settings_->set(SettingsStore::kLanguageHint, code)) {
        FV_LOG_WARN(kTag, "Could not persist language hint");
    }

    auto bundle = current_bundle();
    if (bundle && bundle->language == SpeechLanguage::multilingual && engine_) {
        return reload_locked(*bundle, "Failed to switch model: ");
    }
    return true;
}

bool TranscriptionSession::set_translate_to_english(bool enabled) {
    std::lock_guard<std::mutex> lock(op_mu_);

    {
        std::lock_guard<std::mutex> info_lock(info_mu_);
        if (translate_ == enabled) return true;
        translate_ = enabled;
    }
    if (settings_ && !settings_->set_bool(SettingsStore::kTranslateToEnglish, enabled)) {
        FV_LOG_WARN(kTag, "Could not persist translate flag");
    }

    auto bundle = current_bundle();
    if (bundle && bundle->language == SpeechLanguage::multilingual && engine_) {
        return reload_locked(*bundle, "Failed to switch model: ");
    }
    return true;
}

bool TranscriptionSession::set_speaker_label(const std::string& speaker_id, const std::string& label) {
    std::optional<Speaker> changed;
    {
        std::lock_guard<std::mutex> lock(info_mu_);
        auto it = speakers_.find(speaker_id);
        if (it == speakers_.end()) return false;
        it->second.label = label;
        if (current_speaker_ && current_speaker_->id == speaker_id) {
            current_speaker_ = it->second;
            changed = it->second;
        }
    }
    if (changed) {
        emit(TranscriptionEvent::speaker_changed(*changed));
    }
    return true;
}

} // namespace fv
