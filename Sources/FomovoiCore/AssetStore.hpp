#pragma once

#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fv {

class SettingsStore;

/// Local bookkeeping for model bundles under one asset root.
///
/// Layout: <root>/<bundle id>/<file name>.  A `.tmp` suffix marks a file
/// still being downloaded.  Completeness is all-or-nothing: every manifest
/// file must exist with exactly its expected size.
class AssetStore {
public:
    /// @param root      Asset root; created if missing.
    /// @param settings  Persists the selected bundle id.  May be null, in
    ///                  which case the selection lives in memory only.
    AssetStore(std::filesystem::path root, SettingsStore* settings);

    /// Built-in catalog of whisper.cpp ggml checkpoints.
    static std::vector<ModelBundle> default_catalog();

    /// Replace the known bundles (e.g. with a discovered catalog).
    void set_catalog(std::vector<ModelBundle> bundles);

    /// Every known bundle with `is_complete` filled in from disk.
    std::vector<ModelBundle> catalog() const;

    std::optional<ModelBundle> find(const std::string& id) const;

    bool is_complete(const ModelBundle& bundle) const;

    std::filesystem::path root() const { return root_; }
    std::filesystem::path bundle_dir(const ModelBundle& bundle) const;

    // ---- Selection ----

    /// Persisted selection, only if that bundle is still known and complete.
    std::optional<ModelBundle> selected() const;

    /// Persist `bundle` as the active one.  Returns false for an unknown id
    /// or a failed write.
    bool select(const ModelBundle& bundle);

    std::optional<std::string> selected_id() const;

    /// Smallest complete bundle, optionally restricted to one language.
    std::optional<ModelBundle> smallest_complete(
        std::optional<SpeechLanguage> language = std::nullopt) const;

    // ---- Disk ----

    /// Delete the bundle directory.  Missing directories count as success.
    bool remove(const ModelBundle& bundle);

    /// Sum of file sizes under the asset root, recursively.
    int64_t storage_used() const;

private:
    std::filesystem::path    root_;
    SettingsStore*           settings_;

    std::vector<ModelBundle> bundles_;
    std::string              memory_selection_;   // used when settings_ is null
    mutable std::mutex       mu_;
};

} // namespace fv
