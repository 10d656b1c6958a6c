#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace fv {

/// Runtime configuration.  Every field has a usable default so the
/// pipeline can run without a config file.
struct AppConfig {
    std::string models_dir  = "speech-models";
    std::string settings_db = "fomovoi.db";
    std::string log_file;
    std::string log_level   = "info";

    // Capture
    int         sample_rate = 16000;
    std::string capture_device;            // empty = platform default

    // Recognition engine
    int         window_seconds    = 28;    // whisper context is ~30 s
    int         engine_threads    = 2;
    int         decode_timeout_ms = 0;     // 0 = no deadline

    // Scheduling and events
    int         scheduler_workers = 2;
    int         event_capacity    = 64;

    // Downloads
    int         max_attempts        = 3;
    int         backoff_ms          = 1000;
    int         connect_timeout_ms  = 30000;
    int         low_speed_timeout_s = 60;
    std::string user_agent          = "fomovoi/1.0";

    // Catalog discovery
    bool        discovery_enabled = true;
    std::string discovery_repo    = "ggerganov/whisper.cpp";
};

/// Canonical defaults as JSON, matching a default-constructed AppConfig.
nlohmann::json default_config_json();

/// Copy values from `j` into `out`.  Missing keys keep their defaults.
void config_from_json(const nlohmann::json& j, AppConfig& out);

/// Fill keys that are missing (or of the wrong type) in `cfg` from `defs`.
/// Returns true if anything was patched.
bool merge_defaults(nlohmann::json& cfg, const nlohmann::json& defs,
                    int* patched_count = nullptr);

/// Load `path` into `out`.  A missing file is created with defaults; a file
/// with missing keys is patched and written back.  Returns false if the
/// file was unreadable JSON (it is then reset to defaults).
bool load_config(const std::filesystem::path& path, AppConfig& out);

} // namespace fv
