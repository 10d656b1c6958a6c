#include "AssetStore.hpp"
#include "Logger.hpp"
#include "SettingsStore.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace fv {

namespace {

constexpr const char* kWhisperBaseUrl = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";

ModelBundle make_bundle(const char* id, ModelType type, SpeechLanguage language,
                        const char* file, int64_t size) {
    ModelBundle b;
    b.id = id;
    b.type = type;
    b.language = language;
    b.base_url = kWhisperBaseUrl;
    b.files.push_back(ModelFile{file, size});
    return b;
}

} // namespace

AssetStore::AssetStore(fs::path root, SettingsStore* settings)
    : root_(std::move(root)), settings_(settings), bundles_(default_catalog()) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        FV_LOG_WARN("AssetStore", "Cannot create asset root " + root_.string() + ": " + ec.message());
    }
}

std::vector<ModelBundle> AssetStore::default_catalog() {
    return {
        make_bundle("whisper-tiny.en",  ModelType::whisper_tiny,  SpeechLanguage::english,
                    "ggml-tiny.en.bin",  77704715),
        make_bundle("whisper-tiny",     ModelType::whisper_tiny,  SpeechLanguage::multilingual,
                    "ggml-tiny.bin",     77691713),
        make_bundle("whisper-base.en",  ModelType::whisper_base,  SpeechLanguage::english,
                    "ggml-base.en.bin",  147964211),
        make_bundle("whisper-base",     ModelType::whisper_base,  SpeechLanguage::multilingual,
                    "ggml-base.bin",     147951465),
        make_bundle("whisper-small.en", ModelType::whisper_small, SpeechLanguage::english,
                    "ggml-small.en.bin", 487614201),
        make_bundle("whisper-small",    ModelType::whisper_small, SpeechLanguage::multilingual,
                    "ggml-small.bin",    487601967),
    };
}

void AssetStore::set_catalog(std::vector<ModelBundle> bundles) {
    std::lock_guard<std::mutex> lock(mu_);
    bundles_ = std::move(bundles);
    FV_LOG_DEBUG("AssetStore", "Catalog now has " + std::to_string(bundles_.size()) + " bundle(s)");
}

std::vector<ModelBundle> AssetStore::catalog() const {
    std::vector<ModelBundle> out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        out = bundles_;
    }
    for (auto& b : out) {
        b.is_complete = is_complete(b);
    }
    return out;
}

std::optional<ModelBundle> AssetStore::find(const std::string& id) const {
    std::optional<ModelBundle> found;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& b : bundles_) {
            if (b.id == id) {
                found = b;
                break;
            }
        }
    }
    if (found) {
        found->is_complete = is_complete(*found);
    }
    return found;
}

bool AssetStore::is_complete(const ModelBundle& bundle) const {
    if (bundle.files.empty()) return false;

    fs::path dir = bundle_dir(bundle);
    for (const auto& f : bundle.files) {
        std::error_code ec;
        auto size = fs::file_size(dir / f.name, ec);
        if (ec || static_cast<int64_t>(size) != f.expected_size) {
            return false;
        }
    }
    return true;
}

fs::path AssetStore::bundle_dir(const ModelBundle& bundle) const {
    return root_ / bundle.id;
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

std::optional<std::string> AssetStore::selected_id() const {
    if (settings_) {
        return settings_->get(SettingsStore::kSelectedBundle);
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (memory_selection_.empty()) return std::nullopt;
    return memory_selection_;
}

std::optional<ModelBundle> AssetStore::selected() const {
    auto id = selected_id();
    if (!id) return std::nullopt;

    auto bundle = find(*id);
    if (!bundle) {
        FV_LOG_DEBUG("AssetStore", "Selected bundle '" + *id + "' is not in the catalog");
        return std::nullopt;
    }
    if (!bundle->is_complete) {
        FV_LOG_DEBUG("AssetStore", "Selected bundle '" + *id + "' is incomplete on disk");
        return std::nullopt;
    }
    return bundle;
}

bool AssetStore::select(const ModelBundle& bundle) {
    if (!find(bundle.id)) {
        FV_LOG_WARN("AssetStore", "Refusing to select unknown bundle '" + bundle.id + "'");
        return false;
    }
    if (settings_) {
        if (!settings_->set(SettingsStore::kSelectedBundle, bundle.id)) {
            return false;
        }
    } else {
        std::lock_guard<std::mutex> lock(mu_);
        memory_selection_ = bundle.id;
    }
    FV_LOG_INFO("AssetStore", "Selected " + bundle.id);
    return true;
}

std::optional<ModelBundle> AssetStore::smallest_complete(
        std::optional<SpeechLanguage> language) const {
    std::optional<ModelBundle> best;
    for (const auto& b : catalog()) {
        if (!b.is_complete) continue;
        if (language && b.language != *language) continue;
        if (!best || b.total_size_bytes() < best->total_size_bytes()) {
            best = b;
        }
    }
    return best;
}

// ---------------------------------------------------------------------------
// Disk
// ---------------------------------------------------------------------------

bool AssetStore::remove(const ModelBundle& bundle) {
    fs::path dir = bundle_dir(bundle);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return true;
    }
    fs::remove_all(dir, ec);
    if (ec) {
        FV_LOG_ERROR("AssetStore", "Failed to delete " + dir.string() + ": " + ec.message());
        return false;
    }
    FV_LOG_INFO("AssetStore", "Deleted " + bundle.id);
    return true;
}

int64_t AssetStore::storage_used() const {
    int64_t total = 0;
    std::error_code ec;
    if (!fs::exists(root_, ec)) return 0;

    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            auto size = it->file_size(size_ec);
            if (!size_ec) total += static_cast<int64_t>(size);
        }
    }
    if (ec) {
        FV_LOG_WARN("AssetStore", "Storage scan stopped early: " + ec.message());
    }
    return total;
}

} // namespace fv
