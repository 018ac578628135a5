#include "chunked/server/status_resolver.hpp"

#include "chunked/core/identifiers.hpp"

namespace chunked::server {

StatusResolver::StatusResolver(storage::StagingArea& staging, storage::ArtifactCatalog& catalog)
    : staging_(staging),
      catalog_(catalog) {
}

Result<UploadStatus> StatusResolver::resolve(const std::string& fingerprint,
                                             const std::string& artifact_name) const {
    if (auto res = validate_fingerprint(fingerprint); res.is_error()) {
        return Err<UploadStatus>(res.error());
    }
    if (auto res = validate_artifact_name(artifact_name); res.is_error()) {
        return Err<UploadStatus>(res.error());
    }

    UploadStatus status;

    // Same content under any name counts as present
    if (auto entry = catalog_.find_by_fingerprint(fingerprint)) {
        status.exists = true;
        status.location = artifact_location(entry->artifact_name);
        return Ok(std::move(status));
    }

    auto indices = staging_.list_indices(fingerprint);
    if (indices.is_error()) {
        return Err<UploadStatus>(indices.error());
    }
    status.stored_indices = std::move(indices.value());
    return Ok(std::move(status));
}

} // namespace chunked::server
