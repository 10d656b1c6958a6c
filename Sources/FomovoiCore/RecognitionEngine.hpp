#pragma once

#include "Types.hpp"

#include <memory>
#include <string>

namespace fv {

/// Options a session passes when it (re)builds an engine.
struct EngineOptions {
    std::string language = "en";   // whisper language code, "" = auto-detect
    bool        translate = false;  // translate to English (multilingual only)
    int         threads = 2;
    int         window_seconds = 28;
    int         decode_timeout_ms = 0;
};

/// A speech recognizer usable by TranscriptionSession.
///
/// decode_window() must be callable from several worker threads at once:
/// implementations keep per-call inference state.  Failures are reported
/// by throwing; the scheduler turns them into empty text.
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    /// Load the bundle whose files live in `bundle_dir`.  Throws
    /// std::runtime_error if the engine cannot be built.
    virtual void initialize(const ModelBundle& bundle,
                            const std::string& bundle_dir,
                            const EngineOptions& options) = 0;

    /// Recognize one window.  Returns trimmed text, possibly empty.
    virtual std::string decode_window(const Window& window) = 0;

    /// Abort in-flight decodes and free the model.  Idempotent.
    virtual void release() = 0;

    virtual bool is_loaded() const = 0;

    /// Target window duration for this engine's context limit.
    virtual int window_seconds() const = 0;
};

using EngineFactory = std::function<std::unique_ptr<RecognitionEngine>()>;

} // namespace fv
