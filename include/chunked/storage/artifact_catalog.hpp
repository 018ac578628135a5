#pragma once

#include "chunked/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunked::storage {

/**
 * @brief One assembled artifact and the content it was assembled from
 */
struct CatalogEntry {
    std::string fingerprint;
    std::string artifact_name;
    std::uint64_t size = 0;
    std::int64_t assembled_at = 0;  ///< Unix seconds
};

/**
 * @brief Fingerprint <-> artifact mapping behind the fast path
 *
 * Lets the status check answer "this content is already assembled" by
 * content identity rather than by file name. Persisted as
 * `<artifacts_root>/.catalog.json`; an entry whose artifact file has
 * disappeared is treated as absent.
 *
 * THREAD SAFETY: all methods are internally synchronized.
 */
class ArtifactCatalog {
public:
    static constexpr const char* kCatalogFileName = ".catalog.json";

    explicit ArtifactCatalog(std::filesystem::path artifacts_root);

    /**
     * @brief Create the artifacts root and read the persisted catalog, if any
     */
    Result<void> load();

    std::optional<CatalogEntry> find_by_fingerprint(const std::string& fingerprint) const;
    std::optional<CatalogEntry> find_by_name(const std::string& artifact_name) const;

    /**
     * @brief Remember a freshly assembled artifact
     *
     * The in-memory mapping is always updated. An error only means the
     * catalog file could not be rewritten.
     */
    Result<void> record(const CatalogEntry& entry);

    /**
     * @brief Rename a finished temp file onto the artifact name and record it
     *
     * The rename and the mapping update happen under the catalog lock, so two
     * merges publishing the same name leave the file and its fingerprint in
     * agreement whichever finishes last. Failing to rewrite the catalog file
     * is logged, not returned.
     *
     * ERRORS: IoFailure when the rename fails; the mapping is then unchanged
     */
    Result<void> publish(const std::filesystem::path& temp_path, const CatalogEntry& entry);

    std::size_t size() const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    std::filesystem::path artifact_path(const std::string& artifact_name) const;

private:
    void record_locked(const CatalogEntry& entry);
    Result<void> persist_locked() const;
    bool artifact_present(const std::string& artifact_name) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CatalogEntry> by_fingerprint_;
    std::unordered_map<std::string, std::string> fingerprint_by_name_;
};

} // namespace chunked::storage
