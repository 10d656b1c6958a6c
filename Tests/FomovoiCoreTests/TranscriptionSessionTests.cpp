#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "AssetStore.hpp"
#include "SettingsStore.hpp"
#include "TestSupport.hpp"
#include "TranscriptionSession.hpp"

using namespace fv;
using fv_test::TempDir;
using fv_test::write_file;

namespace {

/// Observations shared between a test and the engines its factory builds.
struct FakeEngineState {
    std::mutex                 mu;
    std::map<int64_t, size_t>  window_sizes;    // index -> samples
    std::set<int64_t>          failing;         // indices that throw
    std::map<int64_t, int>     delay_ms;        // index -> decode time
    std::vector<EngineOptions> options_seen;
    std::vector<std::string>   dirs_seen;
    bool                       fail_init = false;
    int                        window_seconds = 28;
    std::atomic<int>           released{0};
    std::atomic<int>           decodes_after_release{0};
};

class FakeEngine : public RecognitionEngine {
public:
    explicit FakeEngine(std::shared_ptr<FakeEngineState> state) : state_(std::move(state)) {}

    void initialize(const ModelBundle&, const std::string& bundle_dir,
                    const EngineOptions& options) override {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->options_seen.push_back(options);
        state_->dirs_seen.push_back(bundle_dir);
        if (state_->fail_init) throw std::runtime_error("bad model file");
        loaded_ = true;
    }

    std::string decode_window(const Window& window) override {
        if (!loaded_.load()) ++state_->decodes_after_release;

        int delay = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            state_->window_sizes[window.sequence_index] = window.samples.size();
            auto it = state_->delay_ms.find(window.sequence_index);
            if (it != state_->delay_ms.end()) delay = it->second;
            if (state_->failing.count(window.sequence_index)) {
                throw std::runtime_error("decode failed");
            }
        }
        // Decodes overlap here, so later windows can finish first.
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        return "w" + std::to_string(window.sequence_index);
    }

    void release() override {
        if (loaded_.exchange(false)) ++state_->released;
    }

    bool is_loaded() const override { return loaded_.load(); }

    int window_seconds() const override { return state_->window_seconds; }

private:
    std::shared_ptr<FakeEngineState> state_;
    std::atomic<bool>                loaded_{false};
};

ModelBundle fake_bundle(const std::string& id, SpeechLanguage language, int64_t size) {
    ModelBundle b;
    b.id = id;
    b.type = ModelType::whisper_tiny;
    b.language = language;
    b.base_url = "http://localhost/models";
    b.files.push_back(ModelFile{"model.bin", size});
    return b;
}

void install(const AssetStore& store, const ModelBundle& bundle) {
    write_file(store.bundle_dir(bundle) / "model.bin",
               std::string(static_cast<size_t>(bundle.files[0].expected_size), 'm'));
}

/// One asset root with an English and a multilingual bundle in the catalog.
struct Fixture {
    TempDir                          dir{"fv_session"};
    AssetStore                       store{dir.path / "models", nullptr};
    std::shared_ptr<FakeEngineState> engine = std::make_shared<FakeEngineState>();
    ModelBundle                      english = fake_bundle("fake-en", SpeechLanguage::english, 4);
    ModelBundle                      multi = fake_bundle("fake-multi", SpeechLanguage::multilingual, 8);

    Fixture() { store.set_catalog({english, multi}); }

    EngineFactory factory() {
        auto state = engine;
        return [state]() { return std::make_unique<FakeEngine>(state); };
    }
};

std::vector<int16_t> seconds_of_audio(int seconds) {
    return std::vector<int16_t>(static_cast<size_t>(seconds) * kCanonicalSampleRate, 100);
}

void feed_in_chunks(TranscriptionSession& session, const std::vector<int16_t>& audio, size_t chunk) {
    for (size_t pos = 0; pos < audio.size(); pos += chunk) {
        size_t n = std::min(chunk, audio.size() - pos);
        session.accept_samples(std::vector<int16_t>(audio.begin() + pos, audio.begin() + pos + n));
    }
}

size_t count_kind(const std::vector<TranscriptionEvent>& events, TranscriptionEvent::Kind kind) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [kind](const TranscriptionEvent& e) { return e.kind == kind; }));
}

} // namespace

static void test_missing_model_reports_one_error() {
    Fixture f;
    std::vector<SessionState> states;
    TranscriptionSession session(f.store, nullptr, f.factory());
    session.set_state_callback([&states](SessionState s) { states.push_back(s); });

    assert(!session.initialize());
    assert(session.state() == SessionState::error);
    assert((states == std::vector<SessionState>{SessionState::initializing, SessionState::error}));

    auto events = session.events().drain();
    assert(events.size() == 1);
    assert(events[0].kind == TranscriptionEvent::Kind::error);
    assert(events[0].text == "No model available. Please download a model.");
    assert(f.engine->options_seen.empty());
}

static void test_start_before_initialize_is_refused() {
    Fixture f;
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(!session.start());
    assert(session.state() == SessionState::idle);
    assert(!session.start());

    auto events = session.events().drain();
    assert(events.size() == 1);
    assert(events[0].kind == TranscriptionEvent::Kind::error);
    assert(events[0].text == "No model available. Please download a model.");
}

static void test_initialize_picks_smallest_complete_and_selects_it() {
    Fixture f;
    install(f.store, f.english);
    install(f.store, f.multi);
    TranscriptionSession session(f.store, nullptr, f.factory());

    assert(session.initialize());
    assert(session.state() == SessionState::ready);
    assert(session.current_bundle()->id == "fake-en");
    assert(session.current_language() == SpeechLanguage::english);
    assert(f.store.selected_id().value() == "fake-en");
    assert(session.current_speaker()->id == "speaker_1");

    assert(f.engine->options_seen.size() == 1);
    assert(f.engine->options_seen[0].language == "en");
    assert(!f.engine->options_seen[0].translate);
    assert(f.engine->dirs_seen[0] == f.store.bundle_dir(f.english).string());
}

static void test_engine_init_failure_is_reported() {
    Fixture f;
    install(f.store, f.english);
    f.engine->fail_init = true;
    TranscriptionSession session(f.store, nullptr, f.factory());

    assert(!session.initialize());
    assert(session.state() == SessionState::error);
    auto events = session.events().drain();
    assert(events.size() == 1);
    assert(events[0].text == "Failed to initialize: bad model file");
}

static void test_stop_without_audio_yields_nothing() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());
    assert(session.state() == SessionState::transcribing);

    assert(!session.stop().has_value());
    assert(session.state() == SessionState::ready);
    assert(session.windows_submitted() == 0);
    assert(session.events().drain().empty());
}

static void test_short_utterance_is_one_tail_window() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());

    feed_in_chunks(session, seconds_of_audio(5), 1600);
    assert(session.windows_submitted() == 0);

    auto result = session.stop();
    assert(result.has_value());
    assert(result->full_text == "w0");
    assert(result->is_complete);
    assert(result->duration_ms == 5000);
    assert(result->utterances.size() == 1);
    assert(result->utterances[0].start_ms == 0);
    assert(result->utterances[0].end_ms == 5000);
    assert(result->utterances[0].speaker.id == "speaker_1");
    assert(!result->id.empty());
    assert(result->formatted_text() == "[Speaker 1]: w0");

    auto events = session.events().drain();
    assert(count_kind(events, TranscriptionEvent::Kind::final_result) == 1);
    assert(events.back().kind == TranscriptionEvent::Kind::final_result);
    assert(events.back().utterance->text == "w0");
}

static void test_long_recording_is_cut_into_windows_in_order() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());

    feed_in_chunks(session, seconds_of_audio(65), 1600);
    auto result = session.stop();
    assert(result.has_value());
    assert(result->full_text == "w0 w1 w2");
    assert(result->utterances[0].end_ms == 65000);
    assert(session.windows_submitted() == 3);

    std::lock_guard<std::mutex> lock(f.engine->mu);
    assert(f.engine->window_sizes.size() == 3);
    assert(f.engine->window_sizes[0] == 448000);
    assert(f.engine->window_sizes[1] == 448000);
    assert(f.engine->window_sizes[2] == 144000);
}

static void test_partials_are_prefixes_of_the_final_text() {
    Fixture f;
    install(f.store, f.english);
    f.engine->window_seconds = 1;
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());

    feed_in_chunks(session, seconds_of_audio(12), 4000);
    auto result = session.stop();
    assert(result.has_value());
    assert(result->full_text == "w0 w1 w2 w3 w4 w5 w6 w7 w8 w9 w10 w11");

    auto events = session.events().drain();
    assert(events.back().kind == TranscriptionEvent::Kind::final_result);

    std::string previous;
    for (const auto& e : events) {
        if (e.kind != TranscriptionEvent::Kind::partial_result) continue;
        assert(!e.text.empty());
        assert(e.text.size() > previous.size());
        assert(e.text.compare(0, previous.size(), previous) == 0);
        assert(result->full_text.compare(0, e.text.size(), e.text) == 0);
        previous = e.text;
    }
    assert(count_kind(events, TranscriptionEvent::Kind::partial_result) >= 1);
}

static void test_out_of_order_completion_keeps_window_order() {
    Fixture f;
    install(f.store, f.english);
    f.engine->window_seconds = 1;
    for (int64_t i = 0; i < 6; ++i) {
        f.engine->delay_ms[i] = static_cast<int>(6 - i) * 15;   // later windows finish first
    }
    SessionOptions opts;
    opts.scheduler_workers = 4;
    TranscriptionSession session(f.store, nullptr, f.factory(), opts);
    assert(session.initialize());
    assert(session.start());

    feed_in_chunks(session, seconds_of_audio(6), 16000);
    auto result = session.stop();
    assert(result.has_value());
    assert(result->full_text == "w0 w1 w2 w3 w4 w5");

    auto events = session.events().drain();
    std::string previous;
    for (const auto& e : events) {
        if (e.kind != TranscriptionEvent::Kind::partial_result) continue;
        assert(e.text.size() > previous.size());
        assert(e.text.compare(0, previous.size(), previous) == 0);
        assert(result->full_text.compare(0, e.text.size(), e.text) == 0);
        previous = e.text;
    }
    assert(events.back().kind == TranscriptionEvent::Kind::final_result);
}

static void test_reload_never_decodes_on_a_released_engine() {
    Fixture f;
    install(f.store, f.english);
    f.engine->window_seconds = 1;
    for (int64_t i = 0; i < 4; ++i) f.engine->delay_ms[i] = 30;
    SessionOptions opts;
    opts.scheduler_workers = 2;
    TranscriptionSession session(f.store, nullptr, f.factory(), opts);
    assert(session.initialize());
    assert(session.start());

    feed_in_chunks(session, seconds_of_audio(4), 16000);
    assert(session.initialize());   // stops, then swaps the engine
    assert(session.state() == SessionState::ready);
    assert(f.engine->released.load() == 1);

    assert(session.start());
    feed_in_chunks(session, seconds_of_audio(2), 16000);
    auto result = session.stop();
    assert(result.has_value());
    assert(result->full_text == "w0 w1");
    assert(f.engine->decodes_after_release.load() == 0);
}

static void test_failed_window_leaves_a_gap_not_an_error() {
    Fixture f;
    install(f.store, f.english);
    f.engine->window_seconds = 1;
    f.engine->failing.insert(1);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());

    feed_in_chunks(session, seconds_of_audio(3), 1600);
    auto result = session.stop();
    assert(result.has_value());
    assert(result->full_text == "w0 w2");
    assert(session.state() == SessionState::ready);
    assert(count_kind(session.events().drain(), TranscriptionEvent::Kind::error) == 0);
}

static void test_sessions_can_repeat() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());

    for (int round = 0; round < 2; ++round) {
        assert(session.start());
        feed_in_chunks(session, seconds_of_audio(2), 1600);
        auto result = session.stop();
        assert(result.has_value());
        assert(result->full_text == "w0");
    }
}

static void test_odd_length_bytes_are_dropped() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());

    session.accept_audio(std::vector<uint8_t>{1, 2, 3});
    assert(!session.stop().has_value());
    assert(session.windows_submitted() == 0);
}

static void test_audio_outside_a_session_is_ignored() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());

    session.accept_samples(seconds_of_audio(30));
    assert(session.start());
    assert(!session.stop().has_value());
}

static void test_release_returns_to_idle() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());
    feed_in_chunks(session, seconds_of_audio(30), 1600);

    session.release();
    assert(session.state() == SessionState::idle);
    assert(!session.current_bundle().has_value());
    assert(f.engine->released.load() == 1);

    session.events().drain();
    assert(!session.stop().has_value());
    assert(!session.start());
    assert(!session.start());
    assert(count_kind(session.events().drain(), TranscriptionEvent::Kind::error) == 1);

    // Re-initializing after a release works.
    session.events().drain();
    assert(session.initialize());
    assert(session.state() == SessionState::ready);
}

static void test_speaker_relabel_emits_change() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());

    assert(!session.set_speaker_label("speaker_9", "Nobody"));
    assert(session.set_speaker_label("speaker_1", "Alice"));

    auto events = session.events().drain();
    assert(events.size() == 1);
    assert(events[0].kind == TranscriptionEvent::Kind::speaker_change);
    assert(events[0].speaker->label == "Alice");

    assert(session.start());
    feed_in_chunks(session, seconds_of_audio(1), 1600);
    auto result = session.stop();
    assert(result->utterances[0].speaker.label == "Alice");
}

static void test_set_language_without_bundle_keeps_current_engine() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());

    assert(!session.set_language(SpeechLanguage::multilingual));
    auto events = session.events().drain();
    assert(events.size() == 1);
    assert(events[0].text == "No Multilingual model downloaded");
    assert(session.state() == SessionState::ready);
    assert(session.current_bundle()->id == "fake-en");
}

static void test_set_language_switches_bundle() {
    Fixture f;
    install(f.store, f.english);
    install(f.store, f.multi);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());
    assert(session.start());

    assert(session.set_language(SpeechLanguage::multilingual));
    assert(session.state() == SessionState::ready);
    assert(session.current_bundle()->id == "fake-multi");
    assert(session.current_language() == SpeechLanguage::multilingual);
    assert(f.store.selected_id().value() == "fake-multi");
    assert(f.engine->released.load() == 1);
    assert(f.engine->options_seen.back().language.empty());   // auto-detect
}

static void test_language_hint_and_translate_persist() {
    Fixture f;
    install(f.store, f.multi);
    SettingsStore settings(":memory:");
    assert(settings.open());

    {
        TranscriptionSession session(f.store, &settings, f.factory());
        assert(session.initialize());
        assert(session.current_bundle()->id == "fake-multi");

        assert(!session.set_language_hint("xx"));
        assert(session.set_language_hint("de"));
        assert(session.set_translate_to_english(true));
        assert(session.language_hint() == "de");
        assert(session.translate_to_english());

        // Both changes rebuilt the multilingual engine.
        assert(f.engine->options_seen.size() == 3);
        assert(f.engine->options_seen.back().language == "de");
        assert(f.engine->options_seen.back().translate);
    }

    assert(settings.get(SettingsStore::kLanguageHint).value() == "de");
    assert(settings.get_bool(SettingsStore::kTranslateToEnglish, false));

    TranscriptionSession reopened(f.store, &settings, f.factory());
    assert(reopened.language_hint() == "de");
    assert(reopened.translate_to_english());
}

static void test_english_bundle_ignores_hint() {
    Fixture f;
    install(f.store, f.english);
    TranscriptionSession session(f.store, nullptr, f.factory());
    assert(session.initialize());

    assert(session.set_language_hint("fr"));
    assert(f.engine->options_seen.size() == 1);   // no rebuild
    assert(f.engine->options_seen[0].language == "en");
}

int main() {
    test_missing_model_reports_one_error();
    test_start_before_initialize_is_refused();
    test_initialize_picks_smallest_complete_and_selects_it();
    test_engine_init_failure_is_reported();
    test_stop_without_audio_yields_nothing();
    test_short_utterance_is_one_tail_window();
    test_long_recording_is_cut_into_windows_in_order();
    test_partials_are_prefixes_of_the_final_text();
    test_out_of_order_completion_keeps_window_order();
    test_reload_never_decodes_on_a_released_engine();
    test_failed_window_leaves_a_gap_not_an_error();
    test_sessions_can_repeat();
    test_odd_length_bytes_are_dropped();
    test_audio_outside_a_session_is_ignored();
    test_release_returns_to_idle();
    test_speaker_relabel_emits_change();
    test_set_language_without_bundle_keeps_current_engine();
    test_set_language_switches_bundle();
    test_language_hint_and_translate_persist();
    test_english_bundle_ignores_hint();
    return 0;
}
