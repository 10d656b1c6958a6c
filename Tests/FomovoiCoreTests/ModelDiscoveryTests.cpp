#include <cassert>
#include <memory>
#include <string>

#include "AssetStore.hpp"
#include "HttpSource.hpp"
#include "ModelDiscovery.hpp"
#include "SettingsStore.hpp"

using namespace fv;

namespace {

const char* kTreeListing = R"([
  {"type": "file", "path": ".gitattributes", "size": 1477},
  {"type": "file", "path": "README.md", "size": 4000},
  {"type": "directory", "path": "coreml", "size": 0},
  {"type": "file", "path": "coreml/ggml-tiny.bin", "size": 10,
   "lfs": {"size": 99}},
  {"type": "file", "path": "ggml-base.en.bin", "size": 134,
   "lfs": {"oid": "abc", "size": 147964211, "pointerSize": 134}},
  {"type": "file", "path": "ggml-tiny.bin", "size": 134,
   "lfs": {"oid": "def", "size": 77691713, "pointerSize": 134}},
  {"type": "file", "path": "ggml-large-v3-turbo.bin", "size": 134,
   "lfs": {"size": 1624555275}},
  {"type": "file", "path": "ggml-small.bin", "size": 0},
  {"type": "file", "path": "ggml-medium.en-q5_0.bin", "size": 539212467}
])";

/// Serves one body for every URL and remembers the last one asked for.
class CannedHttpSource : public HttpSource {
public:
    long        status = 200;
    bool        fail = false;
    std::string body;
    std::string last_url;
    int         calls = 0;

    HttpResponse fetch(const std::string& url, int64_t, const StatusFn& on_status,
                       const DataFn& on_data) override {
        ++calls;
        last_url = url;
        HttpResponse resp;
        if (fail) {
            resp.error = "Could not resolve host";
            return resp;
        }
        resp.status = status;
        if (on_status && !on_status(status)) {
            resp.aborted = true;
            return resp;
        }
        if (status == 200 && on_data) on_data(body.data(), body.size());
        resp.transport_ok = true;
        return resp;
    }
};

} // namespace

static void test_parse_tree_keeps_top_level_ggml_files() {
    auto bundles = ModelDiscovery::parse_tree(kTreeListing, "ggerganov/whisper.cpp");
    assert(bundles.size() == 4);

    // Sorted by size.
    assert(bundles[0].id == "whisper-tiny");
    assert(bundles[0].type == ModelType::whisper_tiny);
    assert(bundles[0].language == SpeechLanguage::multilingual);
    assert(bundles[0].files[0].name == "ggml-tiny.bin");
    assert(bundles[0].files[0].expected_size == 77691713);
    assert(bundles[0].base_url == "https://huggingface.co/ggerganov/whisper.cpp/resolve/main");

    assert(bundles[1].id == "whisper-base.en");
    assert(bundles[1].language == SpeechLanguage::english);
    assert(bundles[1].files[0].expected_size == 147964211);

    assert(bundles[2].id == "whisper-medium.en-q5_0");
    assert(bundles[2].type == ModelType::whisper_medium);
    assert(bundles[2].files[0].expected_size == 539212467);   // plain size when no LFS entry

    assert(bundles[3].id == "whisper-large-v3-turbo");
    assert(bundles[3].type == ModelType::whisper_turbo);
}

static void test_parse_tree_rejects_garbage() {
    assert(ModelDiscovery::parse_tree("not json", "r").empty());
    assert(ModelDiscovery::parse_tree(R"({"error": "Repository not found"})", "r").empty());
    assert(ModelDiscovery::parse_tree("[]", "r").empty());
}

static void test_parse_tree_skips_mistyped_entries() {
    assert(ModelDiscovery::parse_tree(
        R"([{"type": "file", "path": "ggml-tiny.bin", "size": "77691713"}])", "r").empty());
    assert(ModelDiscovery::parse_tree(R"([{"type": "file", "path": null}])", "r").empty());
    assert(ModelDiscovery::parse_tree(
        R"([{"type": 3, "path": "ggml-tiny.bin", "size": 10}])", "r").empty());
    assert(ModelDiscovery::parse_tree(
        R"([{"type": "file", "path": "ggml-tiny.bin", "size": 10, "lfs": {"size": [1]}}])", "r").empty());

    auto bundles = ModelDiscovery::parse_tree(
        R"([{"path": null}, {"type": "file", "path": "ggml-base.bin", "size": 5}])", "r");
    assert(bundles.size() == 1);
    assert(bundles[0].id == "whisper-base");
    assert(bundles[0].files[0].expected_size == 5);

    auto http = std::make_shared<CannedHttpSource>();
    http->body = R"([{"type": "file", "path": "ggml-tiny.bin", "size": "77691713"}])";
    ModelDiscovery discovery(http, "ggerganov/whisper.cpp");
    assert(!discovery.discover().has_value());
}

static void test_discover_queries_tree_endpoint() {
    auto http = std::make_shared<CannedHttpSource>();
    http->body = kTreeListing;
    ModelDiscovery discovery(http, "ggerganov/whisper.cpp");

    auto found = discovery.discover();
    assert(found.has_value());
    assert(found->size() == 4);
    assert(http->last_url == "https://huggingface.co/api/models/ggerganov/whisper.cpp/tree/main");

    http->status = 404;
    assert(!discovery.discover().has_value());

    http->status = 200;
    http->body = "[]";
    assert(!discovery.discover().has_value());
}

static void test_catalog_cache_round_trip() {
    auto original = ModelDiscovery::parse_tree(kTreeListing, "ggerganov/whisper.cpp");
    auto restored = ModelDiscovery::catalog_from_json(ModelDiscovery::catalog_to_json(original));
    assert(restored.has_value());
    assert(restored->size() == original.size());
    for (size_t i = 0; i < original.size(); ++i) {
        assert((*restored)[i].id == original[i].id);
        assert((*restored)[i].type == original[i].type);
        assert((*restored)[i].language == original[i].language);
        assert((*restored)[i].base_url == original[i].base_url);
        assert((*restored)[i].total_size_bytes() == original[i].total_size_bytes());
    }

    assert(!ModelDiscovery::catalog_from_json("[]").has_value());
    assert(!ModelDiscovery::catalog_from_json(R"([{"id": "x"}])").has_value());
    assert(!ModelDiscovery::catalog_from_json(
        R"([{"id": "x", "language": "klingon", "base_url": "u", "files": []}])").has_value());
}

static void test_resolve_catalog_falls_back_in_order() {
    SettingsStore settings(":memory:");
    assert(settings.open());
    auto http = std::make_shared<CannedHttpSource>();
    ModelDiscovery discovery(http, "ggerganov/whisper.cpp");

    // Offline, nothing cached: built-in catalog.
    http->fail = true;
    auto builtin = ModelDiscovery::resolve_catalog(&discovery, &settings);
    assert(builtin.size() == AssetStore::default_catalog().size());
    assert(!settings.get(SettingsStore::kCatalogCache).has_value());

    // Online: discovered catalog, cached.
    http->fail = false;
    http->body = kTreeListing;
    auto online = ModelDiscovery::resolve_catalog(&discovery, &settings);
    assert(online.size() == 4);
    assert(settings.get(SettingsStore::kCatalogCache).has_value());

    // Offline again: the cache wins over the built-in list.
    http->fail = true;
    auto cached = ModelDiscovery::resolve_catalog(&discovery, &settings);
    assert(cached.size() == 4);
    assert(cached[3].id == "whisper-large-v3-turbo");

    // Discovery disabled.
    auto no_discovery = ModelDiscovery::resolve_catalog(nullptr, nullptr);
    assert(no_discovery.size() == 6);
}

int main() {
    test_parse_tree_keeps_top_level_ggml_files();
    test_parse_tree_rejects_garbage();
    test_parse_tree_skips_mistyped_entries();
    test_discover_queries_tree_endpoint();
    test_catalog_cache_round_trip();
    test_resolve_catalog_falls_back_in_order();
    return 0;
}
