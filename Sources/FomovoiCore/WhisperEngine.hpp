#pragma once

#include "RecognitionEngine.hpp"

#include <atomic>
#include <shared_mutex>
#include <string>

namespace fv {

/// RecognitionEngine backed by whisper.cpp.
///
/// The ggml model is loaded once without inference state.  Every
/// decode_window() call allocates its own whisper_state, so decodes on
/// different threads never share mutable context and may overlap.
class WhisperEngine : public RecognitionEngine {
public:
    WhisperEngine();
    ~WhisperEngine() override;

    // Non-copyable.
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /// Loads the first `.bin` file of the bundle.  Throws std::runtime_error
    /// if none is present or whisper rejects it.
    void initialize(const ModelBundle& bundle,
                    const std::string& bundle_dir,
                    const EngineOptions& options) override;

    /// Transcribe one window in a fresh whisper_state.  Throws on inference
    /// failure or when aborted by release() or the decode deadline.
    std::string decode_window(const Window& window) override;

    void release() override;

    bool is_loaded() const override;

    int window_seconds() const override;

private:
    struct whisper_context* ctx_ = nullptr;   // opaque whisper.h handle
    EngineOptions           options_;
    std::atomic<bool>       cancelled_{false};
    mutable std::shared_mutex mu_;            // shared: decode, unique: load/free
};

} // namespace fv
