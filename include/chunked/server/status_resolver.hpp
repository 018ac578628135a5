#pragma once

#include "chunked/core/result.hpp"
#include "chunked/storage/artifact_catalog.hpp"
#include "chunked/storage/staging_area.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chunked::server {

/**
 * @brief Answer to "what do you already have for this content?"
 *
 * Either the content is assembled (`exists` with its `location`) or
 * `stored_indices` lists the committed chunks in ascending order.
 */
struct UploadStatus {
    bool exists = false;
    std::string location;
    std::vector<std::uint32_t> stored_indices;
};

/**
 * @brief Read-only lookup behind the fast path and resume
 */
class StatusResolver {
public:
    StatusResolver(storage::StagingArea& staging, storage::ArtifactCatalog& catalog);

    Result<UploadStatus> resolve(const std::string& fingerprint, const std::string& artifact_name) const;

private:
    storage::StagingArea& staging_;
    storage::ArtifactCatalog& catalog_;
};

} // namespace chunked::server
