#pragma once

#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fv {

class HttpSource;
class SettingsStore;

/// Builds a model catalog from a Hugging Face repository listing.
///
/// Every top-level `ggml-<name>.bin` file becomes a single-file bundle with
/// id `whisper-<name>`; its expected size comes from the LFS pointer.
class ModelDiscovery {
public:
    ModelDiscovery(std::shared_ptr<HttpSource> http, std::string repo);

    /// https://huggingface.co/api/models/<repo>/tree/main
    static std::string tree_url(const std::string& repo);

    /// Parse a tree listing.  Unparseable input yields an empty list.
    static std::vector<ModelBundle> parse_tree(const std::string& json, const std::string& repo);

    /// Query the repository.  Nothing on network or parse failure, or when
    /// no model files were found.
    std::optional<std::vector<ModelBundle>> discover();

    // ---- Catalog cache ----

    static std::string catalog_to_json(const std::vector<ModelBundle>& bundles);
    static std::optional<std::vector<ModelBundle>> catalog_from_json(const std::string& text);

    /// Discover (when `discovery` is non-null), caching a success in
    /// `settings`.  Falls back to the cached catalog, then to the built-in
    /// one.
    static std::vector<ModelBundle> resolve_catalog(ModelDiscovery* discovery,
                                                    SettingsStore* settings);

private:
    std::shared_ptr<HttpSource> http_;
    std::string                 repo_;
};

} // namespace fv
