#pragma once

#include "AudioWindower.hpp"
#include "Config.hpp"
#include "DecodeScheduler.hpp"
#include "EventChannel.hpp"
#include "RecognitionEngine.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fv {

class AssetStore;
class SettingsStore;

struct SessionOptions {
    int           sample_rate = kCanonicalSampleRate;
    size_t        scheduler_workers = 2;
    size_t        event_capacity = 64;
    EngineOptions engine;                 // language/translate are filled per bundle
};

SessionOptions session_options_from_config(const AppConfig& cfg);

/// Streaming transcription session:
///
///   initialize()  -->  start()  -->  accept_audio() ...  -->  stop()
///        |                |                |                    |
///   load bundle,     reset window    cut windows,         flush tail, drain
///   build engine     and decode      submit decodes,      decodes, emit final
///                    counters        emit partials        Utterance
///
/// Events go out through a bounded EventChannel.  No exception escapes a
/// public method: failures become a state change plus one Error event.
class TranscriptionSession {
public:
    /// @param assets    Catalog, completeness and selection of bundles.
    /// @param settings  Persists language hint and translate flag.  May be null.
    /// @param factory   Builds a fresh RecognitionEngine for each (re)load.
    TranscriptionSession(AssetStore& assets, SettingsStore* settings,
                         EngineFactory factory, SessionOptions options = {});
    ~TranscriptionSession();

    // Non-copyable.
    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    // ---- Observation ----

    SessionState state() const { return state_.load(); }

    /// Fired synchronously on every state change.  Must not call back into
    /// the session.
    void set_state_callback(StateCallback cb);

    EventChannel& events() { return events_; }

    std::optional<ModelBundle> current_bundle() const;
    SpeechLanguage             current_language() const;
    std::optional<Speaker>     current_speaker() const;
    std::string                language_hint() const;
    bool                       translate_to_english() const;

    /// Windows submitted in the current (or last) session.
    int64_t windows_submitted() const;

    // ---- Lifecycle ----

    /// Load the selected bundle (or the smallest complete one) and build the
    /// engine.  Returns true when the session is Ready.
    bool initialize();

    /// Begin a new transcription.  Returns true when Transcribing.  From Idle
    /// the "no model" error event is emitted once until the next initialize()
    /// or release().
    bool start();

    /// Feed little-endian s16 mono PCM at the session sample rate.  Ignored
    /// unless Transcribing.
    void accept_audio(const std::vector<uint8_t>& pcm_bytes);
    void accept_samples(const std::vector<int16_t>& samples);

    /// Flush, wait for every pending decode and return the transcript.
    /// Nothing if no speech was recognized or not Transcribing.
    std::optional<TranscriptionResult> stop();

    /// Abrupt teardown: cancel decodes, discard results, free the engine.
    /// The session returns to Idle.
    void release();

    // ---- Reconfiguration ----

    /// Switch to the smallest complete bundle for `language`.
    bool set_language(SpeechLanguage language);

    /// Whisper language code, "" for auto-detect.  Rebuilds the engine when
    /// the active bundle is multilingual.
    bool set_language_hint(const std::string& code);

    bool set_translate_to_english(bool enabled);

    /// Rename a known speaker.  Returns false for an unknown id.
    bool set_speaker_label(const std::string& speaker_id, const std::string& label);

private:
    void set_state(SessionState s);
    void emit(TranscriptionEvent event);
    void fail(const std::string& message);

    EngineOptions engine_options_for(const ModelBundle& bundle) const;

    /// Build and swap in a new engine.  Throws on failure.
    void load_bundle(const ModelBundle& bundle);

    /// Stop if transcribing, then reload the bundle.  Caller holds op_mu_.
    bool reload_locked(const ModelBundle& bundle, const char* failure_prefix);

    std::optional<TranscriptionResult> stop_locked();
    void release_locked();
    void accept_locked(const std::vector<int16_t>& samples);

    void on_window_decoded();

    AssetStore&                        assets_;
    SettingsStore*                     settings_;
    EngineFactory                      factory_;
    SessionOptions                     options_;

    std::atomic<SessionState>          state_{SessionState::idle};
    StateCallback                      state_cb_;

    EventChannel                       events_;

    std::unique_ptr<RecognitionEngine> engine_;
    std::unique_ptr<AudioWindower>     windower_;
    std::optional<ModelBundle>         bundle_;
    SpeechLanguage                     language_ = SpeechLanguage::english;
    std::string                        language_hint_;
    bool                               translate_ = false;

    std::map<std::string, Speaker>     speakers_;
    std::optional<Speaker>             current_speaker_;

    std::chrono::steady_clock::time_point started_at_;
    std::atomic<bool>                  accepting_{false};
    int64_t                            last_prefix_count_ = 0;
    std::string                        last_partial_;
    bool                               idle_error_reported_ = false;   // guarded by op_mu_

    mutable std::mutex                 op_mu_;       // lifecycle and reconfiguration
    std::mutex                         audio_mu_;    // accept vs. flush
    std::mutex                         partial_mu_;  // partial emission
    mutable std::mutex                 info_mu_;     // bundle, speaker, settings reads

    DecodeScheduler                    scheduler_;   // last: its workers call back into the session
};

} // namespace fv
