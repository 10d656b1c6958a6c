#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fv {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

/// Lifecycle of a TranscriptionSession.
enum class SessionState {
    idle,
    initializing,
    ready,
    transcribing,
    error
};

inline const char* state_to_string(SessionState s) {
    switch (s) {
        case SessionState::idle:         return "idle";
        case SessionState::initializing: return "initializing";
        case SessionState::ready:        return "ready";
        case SessionState::transcribing: return "transcribing";
        case SessionState::error:        return "error";
    }
    return "unknown";
}

/// Whisper model variants known to the catalog.
enum class ModelType {
    whisper_tiny,
    whisper_base,
    whisper_small,
    whisper_medium,
    whisper_large,
    whisper_turbo,
    whisper_distil,
    whisper_other
};

inline const char* model_type_display_name(ModelType t) {
    switch (t) {
        case ModelType::whisper_tiny:   return "Whisper Tiny";
        case ModelType::whisper_base:   return "Whisper Base";
        case ModelType::whisper_small:  return "Whisper Small";
        case ModelType::whisper_medium: return "Whisper Medium";
        case ModelType::whisper_large:  return "Whisper Large";
        case ModelType::whisper_turbo:  return "Whisper Turbo";
        case ModelType::whisper_distil: return "Whisper Distil";
        case ModelType::whisper_other:  return "Whisper";
    }
    return "Whisper";
}

inline const char* model_type_description(ModelType t) {
    switch (t) {
        case ModelType::whisper_tiny:   return "Fastest, ~75MB";
        case ModelType::whisper_base:   return "Fast, ~150MB";
        case ModelType::whisper_small:  return "Balanced, ~470MB";
        case ModelType::whisper_medium: return "Good accuracy, ~1.5GB";
        case ModelType::whisper_large:  return "Best accuracy, ~3GB";
        case ModelType::whisper_turbo:  return "Optimized large model";
        case ModelType::whisper_distil: return "Distilled for speed";
        case ModelType::whisper_other:  return "Other Whisper variant";
    }
    return "";
}

/// Map a size token from a model name ("tiny", "large-v3", ...) to a type.
inline ModelType model_type_from_size(const std::string& size) {
    auto starts_with = [&size](const char* prefix) {
        return size.rfind(prefix, 0) == 0;
    };
    if (starts_with("tiny"))   return ModelType::whisper_tiny;
    if (starts_with("base"))   return ModelType::whisper_base;
    if (starts_with("small"))  return ModelType::whisper_small;
    if (starts_with("medium")) return ModelType::whisper_medium;
    if (size.find("turbo") != std::string::npos) return ModelType::whisper_turbo;
    if (starts_with("large"))  return ModelType::whisper_large;
    if (starts_with("distil")) return ModelType::whisper_distil;
    return ModelType::whisper_other;
}

enum class SpeechLanguage {
    english,
    multilingual
};

inline const char* language_code(SpeechLanguage l) {
    return l == SpeechLanguage::english ? "en" : "multi";
}

inline const char* language_display_name(SpeechLanguage l) {
    return l == SpeechLanguage::english ? "English" : "Multilingual";
}

inline std::optional<SpeechLanguage> language_from_code(const std::string& code) {
    if (code == "en")    return SpeechLanguage::english;
    if (code == "multi") return SpeechLanguage::multilingual;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Language hints for multilingual models
// ---------------------------------------------------------------------------

/// Whisper language code plus a display name.  An empty code means
/// auto-detect.
struct LanguageHint {
    std::string code;
    std::string display_name;
};

inline const std::vector<LanguageHint>& language_hints() {
    static const std::vector<LanguageHint> hints = {
        {"",   "Auto-detect"}, {"en", "English"},    {"es", "Spanish"},
        {"fr", "French"},      {"de", "German"},     {"it", "Italian"},
        {"pt", "Portuguese"},  {"nl", "Dutch"},      {"pl", "Polish"},
        {"ru", "Russian"},     {"uk", "Ukrainian"},  {"zh", "Chinese"},
        {"ja", "Japanese"},    {"ko", "Korean"},     {"ar", "Arabic"},
        {"hi", "Hindi"},       {"tr", "Turkish"},    {"vi", "Vietnamese"},
        {"th", "Thai"},        {"id", "Indonesian"}, {"ms", "Malay"},
        {"tl", "Tagalog"},     {"sv", "Swedish"},    {"da", "Danish"},
        {"no", "Norwegian"},   {"fi", "Finnish"},    {"el", "Greek"},
        {"cs", "Czech"},       {"ro", "Romanian"},   {"hu", "Hungarian"},
        {"he", "Hebrew"},
    };
    return hints;
}

inline std::optional<LanguageHint> find_language_hint(const std::string& code) {
    for (const auto& h : language_hints()) {
        if (h.code == code) return h;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Audio
// ---------------------------------------------------------------------------

/// Canonical capture format: mono, signed 16-bit, 16 kHz.
constexpr int kCanonicalSampleRate = 16000;

/// A contiguous slice of session audio handed to the recognizer as one unit.
struct Window {
    int64_t              sequence_index = 0;
    std::vector<int16_t> samples;
    int                  sample_rate = kCanonicalSampleRate;
    bool                 is_tail = false;   // shorter than the target length

    int64_t duration_ms() const {
        if (sample_rate <= 0) return 0;
        return static_cast<int64_t>(samples.size()) * 1000 / sample_rate;
    }
};

// ---------------------------------------------------------------------------
// Transcription output
// ---------------------------------------------------------------------------

struct Speaker {
    std::string id;
    std::string label;
};

inline Speaker default_speaker() {
    return Speaker{"speaker_1", "Speaker 1"};
}

/// A finished span of recognized speech.  Offsets are relative to the
/// session start.
struct Utterance {
    std::string id;
    std::string text;
    Speaker     speaker;
    int64_t     start_ms = 0;
    int64_t     end_ms = 0;
    float       confidence = 1.0f;
};

struct TranscriptionResult {
    std::string            id;
    std::vector<Utterance> utterances;
    std::string            full_text;
    int64_t                duration_ms = 0;
    int64_t                created_at = 0;     // Unix timestamp (seconds)
    bool                   is_complete = false;

    /// "[label]: text" blocks separated by a blank line.
    std::string formatted_text() const {
        std::string out;
        for (const auto& u : utterances) {
            if (!out.empty()) out += "\n\n";
            out += "[" + u.speaker.label + "]: " + u.text;
        }
        return out;
    }
};

/// One item of the session's outbound event stream.
struct TranscriptionEvent {
    enum class Kind {
        partial_result,
        final_result,
        speaker_change,
        error
    };

    Kind                     kind = Kind::partial_result;
    std::string              text;        // partial text or error message
    std::optional<Utterance> utterance;   // final_result only
    std::optional<Speaker>   speaker;     // speaker_change only

    static TranscriptionEvent partial(std::string t) {
        TranscriptionEvent e;
        e.kind = Kind::partial_result;
        e.text = std::move(t);
        return e;
    }
    static TranscriptionEvent final_result(Utterance u) {
        TranscriptionEvent e;
        e.kind = Kind::final_result;
        e.text = u.text;
        e.utterance = std::move(u);
        return e;
    }
    static TranscriptionEvent speaker_changed(Speaker s) {
        TranscriptionEvent e;
        e.kind = Kind::speaker_change;
        e.speaker = std::move(s);
        return e;
    }
    static TranscriptionEvent failure(std::string message) {
        TranscriptionEvent e;
        e.kind = Kind::error;
        e.text = std::move(message);
        return e;
    }
};

// ---------------------------------------------------------------------------
// Model assets
// ---------------------------------------------------------------------------

struct ModelFile {
    std::string name;
    int64_t     expected_size = 0;
};

/// A named set of model files required to build one recognizer
/// configuration.  `is_complete` is filled in by AssetStore from disk.
struct ModelBundle {
    std::string            id;
    ModelType              type = ModelType::whisper_other;
    SpeechLanguage         language = SpeechLanguage::english;
    std::string            base_url;
    std::vector<ModelFile> files;
    bool                   is_complete = false;

    int64_t total_size_bytes() const {
        int64_t total = 0;
        for (const auto& f : files) total += f.expected_size;
        return total;
    }

    int total_size_mb() const {
        return static_cast<int>(total_size_bytes() / 1000000);
    }

    std::string display_name() const {
        return std::string(model_type_display_name(type)) + " ("
               + language_display_name(language) + ")";
    }
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired with fractional progress 0.0 – 1.0.
using ProgressCallback = std::function<void(float)>;

/// Fired during capture with current audio level 0.0 – 1.0.
using MeteringCallback = std::function<void(float)>;

/// Fired by the capture collaborator with little-endian s16 mono PCM bytes.
using PcmCallback = std::function<void(const std::vector<uint8_t>&)>;

/// Fired on every session state change.
using StateCallback = std::function<void(SessionState)>;

} // namespace fv
