#include "Config.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace fv {

namespace fs = std::filesystem;

nlohmann::json default_config_json() {
    AppConfig d;
    return {
        {"models_dir",  d.models_dir},
        {"settings_db", d.settings_db},
        {"log_file",    d.log_file},
        {"log_level",   d.log_level},

        {"audio", {
            {"sample_rate",    d.sample_rate},
            {"capture_device", d.capture_device}
        }},

        {"engine", {
            {"window_seconds",    d.window_seconds},
            {"threads",           d.engine_threads},
            {"decode_timeout_ms", d.decode_timeout_ms}
        }},

        {"scheduler", {
            {"workers", d.scheduler_workers}
        }},

        {"events", {
            {"capacity", d.event_capacity}
        }},

        {"download", {
            {"max_attempts",        d.max_attempts},
            {"backoff_ms",          d.backoff_ms},
            {"connect_timeout_ms",  d.connect_timeout_ms},
            {"low_speed_timeout_s", d.low_speed_timeout_s},
            {"user_agent",          d.user_agent}
        }},

        {"discovery", {
            {"enabled", d.discovery_enabled},
            {"repo",    d.discovery_repo}
        }}
    };
}

void config_from_json(const nlohmann::json& j, AppConfig& out) {
    AppConfig d;
    auto section = [&j](const char* key) {
        return j.contains(key) && j[key].is_object() ? j[key] : nlohmann::json::object();
    };

    out.models_dir  = j.value("models_dir",  d.models_dir);
    out.settings_db = j.value("settings_db", d.settings_db);
    out.log_file    = j.value("log_file",    d.log_file);
    out.log_level   = j.value("log_level",   d.log_level);

    auto audio = section("audio");
    out.sample_rate    = audio.value("sample_rate",    d.sample_rate);
    out.capture_device = audio.value("capture_device", d.capture_device);

    auto engine = section("engine");
    out.window_seconds    = engine.value("window_seconds",    d.window_seconds);
    out.engine_threads    = engine.value("threads",           d.engine_threads);
    out.decode_timeout_ms = engine.value("decode_timeout_ms", d.decode_timeout_ms);

    out.scheduler_workers = section("scheduler").value("workers", d.scheduler_workers);
    out.event_capacity    = section("events").value("capacity", d.event_capacity);

    auto download = section("download");
    out.max_attempts        = download.value("max_attempts",        d.max_attempts);
    out.backoff_ms          = download.value("backoff_ms",          d.backoff_ms);
    out.connect_timeout_ms  = download.value("connect_timeout_ms",  d.connect_timeout_ms);
    out.low_speed_timeout_s = download.value("low_speed_timeout_s", d.low_speed_timeout_s);
    out.user_agent          = download.value("user_agent",          d.user_agent);

    auto discovery = section("discovery");
    out.discovery_enabled = discovery.value("enabled", d.discovery_enabled);
    out.discovery_repo    = discovery.value("repo",    d.discovery_repo);
}

bool merge_defaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patched_count) {
    bool patched = false;
    for (auto& [key, def_val] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = def_val;
            patched = true;
            if (patched_count) (*patched_count)++;
        } else if (def_val.is_object() && cfg[key].is_object()) {
            if (merge_defaults(cfg[key], def_val, patched_count)) patched = true;
        } else if (cfg[key].type() != def_val.type()) {
            // number_integer vs number_unsigned is not a real mismatch.
            if (cfg[key].is_number_integer() && def_val.is_number_integer()) continue;
            cfg[key] = def_val;
            patched = true;
            if (patched_count) (*patched_count)++;
        }
    }
    return patched;
}

bool load_config(const fs::path& path, AppConfig& out) {
    const nlohmann::json defaults = default_config_json();

    if (!fs::exists(path)) {
        std::ofstream(path) << defaults.dump(2) << "\n";
        config_from_json(defaults, out);
        FV_LOG_INFO("Config", "Created " + path.string() + " with defaults");
        return true;
    }

    nlohmann::json cfg;
    try {
        std::ifstream f(path);
        f >> cfg;
    } catch (const nlohmann::json::exception& e) {
        FV_LOG_ERROR("Config", path.string() + " invalid (" + e.what() + "), reset to defaults");
        std::ofstream(path) << defaults.dump(2) << "\n";
        config_from_json(defaults, out);
        return false;
    }

    if (!cfg.is_object()) {
        FV_LOG_ERROR("Config", path.string() + " is not a JSON object, reset to defaults");
        std::ofstream(path) << defaults.dump(2) << "\n";
        config_from_json(defaults, out);
        return false;
    }

    int patched = 0;
    if (merge_defaults(cfg, defaults, &patched)) {
        std::ofstream(path) << cfg.dump(2) << "\n";
        FV_LOG_DEBUG("Config", path.string() + " patched (" + std::to_string(patched) + " keys)");
    }

    config_from_json(cfg, out);
    return true;
}

} // namespace fv
