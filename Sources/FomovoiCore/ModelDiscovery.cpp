#include "ModelDiscovery.hpp"
#include "AssetStore.hpp"
#include "HttpSource.hpp"
#include "Logger.hpp"
#include "SettingsStore.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fv {

namespace {

constexpr const char* kFilePrefix = "ggml-";
constexpr const char* kFileSuffix = ".bin";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
           && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ModelDiscovery::ModelDiscovery(std::shared_ptr<HttpSource> http, std::string repo)
    : http_(std::move(http)), repo_(std::move(repo)) {}

std::string ModelDiscovery::tree_url(const std::string& repo) {
    return "https://huggingface.co/api/models/" + repo + "/tree/main";
}

// ---------------------------------------------------------------------------
// parse_tree
// ---------------------------------------------------------------------------

std::vector<ModelBundle> ModelDiscovery::parse_tree(const std::string& text, const std::string& repo) {
    std::vector<ModelBundle> bundles;

    json entries = json::parse(text, nullptr, false);
    if (entries.is_discarded() || !entries.is_array()) {
        FV_LOG_WARN("ModelDiscovery", "Tree listing for " + repo + " is not a JSON array");
        return bundles;
    }

    for (const auto& entry : entries) {
        if (!entry.is_object()) continue;

        std::string path;
        int64_t size = -1;
        try {
            if (entry.value("type", std::string("file")) != "file") continue;
            path = entry.value("path", std::string());
            size = entry.value("size", size);
            auto lfs = entry.find("lfs");
            if (lfs != entry.end() && lfs->is_object()) {
                size = lfs->value("size", size);
            }
        } catch (const json::exception& e) {
            FV_LOG_DEBUG("ModelDiscovery", std::string("Skipping malformed tree entry: ") + e.what());
            continue;
        }

        if (path.find('/') != std::string::npos) continue;
        if (path.rfind(kFilePrefix, 0) != 0 || !ends_with(path, kFileSuffix)) continue;
        if (size <= 0) {
            FV_LOG_DEBUG("ModelDiscovery", "Skipping " + path + ": no size");
            continue;
        }

        const size_t prefix_len = std::char_traits<char>::length(kFilePrefix);
        const size_t suffix_len = std::char_traits<char>::length(kFileSuffix);
        std::string stem = path.substr(prefix_len, path.size() - prefix_len - suffix_len);
        if (stem.empty()) continue;

        ModelBundle b;
        b.id = "whisper-" + stem;
        b.type = model_type_from_size(stem);
        b.language = stem.find(".en") != std::string::npos ? SpeechLanguage::english
                                                           : SpeechLanguage::multilingual;
        b.base_url = "https://huggingface.co/" + repo + "/resolve/main";
        b.files.push_back(ModelFile{path, size});
        bundles.push_back(std::move(b));
    }

    std::sort(bundles.begin(), bundles.end(), [](const ModelBundle& a, const ModelBundle& b) {
        if (a.total_size_bytes() != b.total_size_bytes()) {
            return a.total_size_bytes() < b.total_size_bytes();
        }
        return a.id < b.id;
    });
    return bundles;
}

std::optional<std::vector<ModelBundle>> ModelDiscovery::discover() {
    const std::string url = tree_url(repo_);
    FV_LOG_DEBUG("ModelDiscovery", "Fetching model info from: " + url);

    std::string body;
    HttpResponse resp = http_->get_text(url, body);
    if (!resp.transport_ok || resp.status != 200) {
        FV_LOG_WARN("ModelDiscovery", "Failed to discover models in " + repo_ + ": "
                    + (resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error));
        return std::nullopt;
    }

    auto bundles = parse_tree(body, repo_);
    if (bundles.empty()) {
        FV_LOG_WARN("ModelDiscovery", "No ggml models found in " + repo_);
        return std::nullopt;
    }
    FV_LOG_INFO("ModelDiscovery", "Discovered " + std::to_string(bundles.size()) + " model(s) in " + repo_);
    return bundles;
}

// ---------------------------------------------------------------------------
// Catalog cache
// ---------------------------------------------------------------------------

std::string ModelDiscovery::catalog_to_json(const std::vector<ModelBundle>& bundles) {
    json arr = json::array();
    for (const auto& b : bundles) {
        json files = json::array();
        for (const auto& f : b.files) {
            files.push_back({{"name", f.name}, {"size", f.expected_size}});
        }
        arr.push_back({
            {"id", b.id},
            {"language", language_code(b.language)},
            {"base_url", b.base_url},
            {"files", files},
        });
    }
    return arr.dump();
}

std::optional<std::vector<ModelBundle>> ModelDiscovery::catalog_from_json(const std::string& text) {
    json arr = json::parse(text, nullptr, false);
    if (arr.is_discarded() || !arr.is_array()) {
        return std::nullopt;
    }

    std::vector<ModelBundle> bundles;
    try {
        for (const auto& j : arr) {
            ModelBundle b;
            b.id = j.at("id").get<std::string>();
            auto lang = language_from_code(j.at("language").get<std::string>());
            if (!lang) return std::nullopt;
            b.language = *lang;
            b.base_url = j.at("base_url").get<std::string>();
            for (const auto& f : j.at("files")) {
                b.files.push_back(ModelFile{f.at("name").get<std::string>(), f.at("size").get<int64_t>()});
            }
            // Type is derived from the id, same as discovery.
            const std::string prefix = "whisper-";
            b.type = model_type_from_size(b.id.rfind(prefix, 0) == 0 ? b.id.substr(prefix.size()) : b.id);
            bundles.push_back(std::move(b));
        }
    } catch (const json::exception& e) {
        FV_LOG_WARN("ModelDiscovery", std::string("Cached catalog unreadable: ") + e.what());
        return std::nullopt;
    }
    if (bundles.empty()) return std::nullopt;
    return bundles;
}

std::vector<ModelBundle> ModelDiscovery::resolve_catalog(ModelDiscovery* discovery,
                                                         SettingsStore* settings) {
    if (discovery) {
        if (auto found = discovery->discover()) {
            if (settings && !settings->set(SettingsStore::kCatalogCache, catalog_to_json(*found))) {
                FV_LOG_WARN("ModelDiscovery", "Could not cache discovered catalog");
            }
            return *found;
        }
    }

    if (settings) {
        if (auto cached = settings->get(SettingsStore::kCatalogCache)) {
            if (auto bundles = catalog_from_json(*cached)) {
                FV_LOG_INFO("ModelDiscovery", "Using cached catalog (" + std::to_string(bundles->size())
                            + " bundles)");
                return *bundles;
            }
        }
    }

    FV_LOG_INFO("ModelDiscovery", "Using built-in catalog");
    return AssetStore::default_catalog();
}

} // namespace fv
