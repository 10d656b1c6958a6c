#include "AssetStore.hpp"
#include "AudioCapture.hpp"
#include "AudioConverter.hpp"
#include "Config.hpp"
#include "CurlHttpSource.hpp"
#include "Logger.hpp"
#include "ModelDiscovery.hpp"
#include "ResumableDownloader.hpp"
#include "SettingsStore.hpp"
#include "TranscriptionSession.hpp"
#include "WhisperEngine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace fv;

namespace {

// 100 ms of canonical audio, the size a capture device typically delivers.
constexpr size_t kFeedSamples = kCanonicalSampleRate / 10;

void print_usage() {
    std::fprintf(stderr,
        "usage: fomovoi [--config PATH] [session options] <command> [args]\n"
        "\n"
        "session options (transcribe, record):\n"
        "  --language en|multi use the smallest downloaded model of that kind\n"
        "  --hint CODE         spoken language for multilingual models\n"
        "  --translate         translate to English (multilingual models)\n"
        "\n"
        "commands:\n"
        "  models              list known models\n"
        "  download <id>       download a model\n"
        "  delete <id>         delete a downloaded model\n"
        "  select <id>         make a downloaded model the active one\n"
        "  transcribe <file>   transcribe an audio file\n"
        "  record              transcribe the microphone until Enter\n"
        "  storage             print bytes used by downloaded models\n");
}

std::string format_mb(int64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / 1e6);
    return buf;
}

/// Prints session events on its own thread until stopped.
class EventPrinter {
public:
    explicit EventPrinter(EventChannel& events)
        : events_(events), thread_([this] { run(); }) {}

    ~EventPrinter() { stop(); }

    void stop() {
        running_.store(false);
        if (thread_.joinable()) thread_.join();
        print_pending();
    }

private:
    void run() {
        while (running_.load()) {
            TranscriptionEvent e;
            if (events_.pop(e, std::chrono::milliseconds(100))) {
                print(e);
            }
        }
    }

    void print_pending() {
        for (const auto& e : events_.drain()) {
            print(e);
        }
    }

    static void print(const TranscriptionEvent& e) {
        switch (e.kind) {
            case TranscriptionEvent::Kind::partial_result:
                std::printf("[partial] %s\n", e.text.c_str());
                break;
            case TranscriptionEvent::Kind::final_result:
                break;   // printed from the returned result
            case TranscriptionEvent::Kind::speaker_change:
                if (e.speaker) std::printf("[speaker] %s\n", e.speaker->label.c_str());
                break;
            case TranscriptionEvent::Kind::error:
                std::fprintf(stderr, "[error] %s\n", e.text.c_str());
                break;
        }
        std::fflush(stdout);
    }

    EventChannel&     events_;
    std::atomic<bool> running_{true};
    std::thread       thread_;
};

/// Reconfiguration requested on the command line.
struct SessionFlags {
    std::optional<SpeechLanguage> language;
    std::optional<std::string>    hint;
    bool                          translate = false;
};

EngineFactory whisper_factory() {
    return [] { return std::make_unique<WhisperEngine>(); };
}

int print_result(const std::optional<TranscriptionResult>& result) {
    if (!result) {
        std::printf("(no speech recognized)\n");
        return 0;
    }
    std::printf("\n%s\n", result->formatted_text().c_str());
    return 0;
}

// ---- Commands ----

int cmd_models(AssetStore& assets) {
    auto selected = assets.selected_id();
    for (const auto& b : assets.catalog()) {
        bool is_selected = selected && *selected == b.id;
        std::printf("%c %-24s %-30s %10s  %s\n",
                    is_selected ? '*' : ' ',
                    b.id.c_str(),
                    b.display_name().c_str(),
                    format_mb(b.total_size_bytes()).c_str(),
                    b.is_complete ? "downloaded" : "-");
    }
    return 0;
}

int cmd_download(AssetStore& assets, const AppConfig& cfg, std::shared_ptr<HttpSource> http,
                 const std::string& id) {
    auto bundle = assets.find(id);
    if (!bundle) {
        std::fprintf(stderr, "unknown model '%s'\n", id.c_str());
        return 1;
    }

    DownloadOptions opts;
    opts.max_attempts = cfg.max_attempts;
    opts.backoff_ms = cfg.backoff_ms;
    ResumableDownloader downloader(assets, std::move(http), opts);

    int last_pct = -1;
    const std::string label = bundle->id;
    DownloadResult r = downloader.download(*bundle, [&last_pct, &label](float p) {
        int pct = static_cast<int>(p * 100.0f);
        if (pct != last_pct) {
            last_pct = pct;
            std::fprintf(stderr, "\rdownloading %s: %3d%%", label.c_str(), pct);
        }
    });
    std::fprintf(stderr, "\n");

    if (!r.success) {
        std::fprintf(stderr, "download failed: %s (%s, %d attempt(s))\n",
                     r.error.c_str(), r.failed_file.c_str(), r.attempts);
        return 1;
    }
    std::printf("%s downloaded (%s fetched)\n", bundle->id.c_str(), format_mb(r.bytes_fetched).c_str());
    if (!assets.selected() && !assets.select(*bundle)) {
        std::fprintf(stderr, "could not select %s\n", bundle->id.c_str());
    }
    return 0;
}

int cmd_delete(AssetStore& assets, const std::string& id) {
    auto bundle = assets.find(id);
    if (!bundle) {
        std::fprintf(stderr, "unknown model '%s'\n", id.c_str());
        return 1;
    }
    return assets.remove(*bundle) ? 0 : 1;
}

int cmd_select(AssetStore& assets, const std::string& id) {
    auto bundle = assets.find(id);
    if (!bundle) {
        std::fprintf(stderr, "unknown model '%s'\n", id.c_str());
        return 1;
    }
    if (!bundle->is_complete) {
        std::fprintf(stderr, "model '%s' is not downloaded\n", id.c_str());
        return 1;
    }
    return assets.select(*bundle) ? 0 : 1;
}

/// Initialize, apply the flags and start.  Errors reach the user through
/// the event printer.
bool begin_session(TranscriptionSession& session, const SessionFlags& flags) {
    if (!session.initialize()) return false;
    if (flags.language && *flags.language != session.current_language()
        && !session.set_language(*flags.language)) {
        return false;
    }
    if (flags.hint && !session.set_language_hint(*flags.hint)) {
        std::fprintf(stderr, "unknown language hint '%s'\n", flags.hint->c_str());
        return false;
    }
    if (flags.translate && !session.set_translate_to_english(true)) {
        return false;
    }
    return session.start();
}

int cmd_transcribe(AssetStore& assets, SettingsStore& settings, const AppConfig& cfg,
                   const SessionFlags& flags, const std::string& path) {
    std::vector<int16_t> pcm;
    try {
        AudioConverter converter;
        pcm = converter.decode_file(path, cfg.sample_rate);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    TranscriptionSession session(assets, &settings, whisper_factory(), session_options_from_config(cfg));
    EventPrinter printer(session.events());

    if (!begin_session(session, flags)) {
        printer.stop();
        return 1;
    }

    for (size_t off = 0; off < pcm.size(); off += kFeedSamples) {
        size_t n = std::min(kFeedSamples, pcm.size() - off);
        session.accept_audio(AudioConverter::samples_to_bytes(pcm.data() + off, n));
    }

    auto result = session.stop();
    printer.stop();
    return print_result(result);
}

int cmd_record(AssetStore& assets, SettingsStore& settings, const AppConfig& cfg,
               const SessionFlags& flags) {
    TranscriptionSession session(assets, &settings, whisper_factory(), session_options_from_config(cfg));
    EventPrinter printer(session.events());

    if (!begin_session(session, flags)) {
        printer.stop();
        return 1;
    }

    AudioCapture capture(cfg.capture_device, cfg.sample_rate);
    bool ok = capture.start([&session](const std::vector<uint8_t>& bytes) {
        session.accept_audio(bytes);
    });
    if (!ok) {
        std::fprintf(stderr, "could not open the capture device\n");
        session.release();
        printer.stop();
        return 1;
    }

    std::fprintf(stderr, "Recording. Press Enter to stop.\n");
    std::string line;
    std::getline(std::cin, line);

    capture.stop();
    auto result = session.stop();
    printer.stop();
    return print_result(result);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "fomovoi.json";
    SessionFlags flags;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--language" && i + 1 < argc) {
            flags.language = language_from_code(argv[++i]);
            if (!flags.language) {
                std::fprintf(stderr, "--language takes 'en' or 'multi'\n");
                return 1;
            }
        } else if (a == "--hint" && i + 1 < argc) {
            flags.hint = argv[++i];
        } else if (a == "--translate") {
            flags.translate = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            return 0;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }

    AppConfig cfg;
    if (!load_config(config_path, cfg)) {
        std::fprintf(stderr, "config %s was invalid and has been reset to defaults\n", config_path.c_str());
    }
    set_log_level(log_level_from_string(cfg.log_level));
    log_init(cfg.log_file);

    SettingsStore settings(cfg.settings_db);
    if (!settings.open()) {
        std::fprintf(stderr, "cannot open settings database %s\n", cfg.settings_db.c_str());
        return 1;
    }

    CurlOptions curl_opts;
    curl_opts.connect_timeout_ms = cfg.connect_timeout_ms;
    curl_opts.low_speed_timeout_s = cfg.low_speed_timeout_s;
    curl_opts.user_agent = cfg.user_agent;
    auto http = std::make_shared<CurlHttpSource>(curl_opts);

    const std::string& cmd = args[0];

    // Only commands that browse or fetch go online for the catalog.
    std::unique_ptr<ModelDiscovery> discovery;
    if (cfg.discovery_enabled && (cmd == "models" || cmd == "download")) {
        discovery = std::make_unique<ModelDiscovery>(http, cfg.discovery_repo);
    }

    AssetStore assets(cfg.models_dir, &settings);
    assets.set_catalog(ModelDiscovery::resolve_catalog(discovery.get(), &settings));

    int rc = 1;
    if (cmd == "models") {
        rc = cmd_models(assets);
    } else if (cmd == "download" && args.size() == 2) {
        rc = cmd_download(assets, cfg, http, args[1]);
    } else if (cmd == "delete" && args.size() == 2) {
        rc = cmd_delete(assets, args[1]);
    } else if (cmd == "select" && args.size() == 2) {
        rc = cmd_select(assets, args[1]);
    } else if (cmd == "transcribe" && args.size() == 2) {
        rc = cmd_transcribe(assets, settings, cfg, flags, args[1]);
    } else if (cmd == "record") {
        rc = cmd_record(assets, settings, cfg, flags);
    } else if (cmd == "storage") {
        int64_t used = assets.storage_used();
        std::printf("%lld bytes (%s) in %s\n", static_cast<long long>(used),
                    format_mb(used).c_str(), assets.root().string().c_str());
        rc = 0;
    } else {
        print_usage();
    }

    log_shutdown();
    return rc;
}
