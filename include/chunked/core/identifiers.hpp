#pragma once

#include "chunked/core/result.hpp"

#include <cstdint>
#include <string>

namespace chunked {

constexpr std::size_t kMaxFingerprintLength = 128;
constexpr std::size_t kMaxArtifactNameLength = 255;

/**
 * @brief Check a client-supplied fingerprint
 *
 * Accepted alphabet is [A-Za-z0-9_-]; the fingerprint becomes a directory
 * name under the staging root, so nothing that could form a path is let in.
 */
Result<void> validate_fingerprint(const std::string& fingerprint);

/**
 * @brief Parse a decimal chunk index ("0", "17"); no sign, no whitespace
 */
Result<std::uint32_t> parse_chunk_index(const std::string& text);

/**
 * @brief Check an artifact name: a single path component
 */
Result<void> validate_artifact_name(const std::string& name);

/// Public locator for a stored artifact
std::string artifact_location(const std::string& name);

} // namespace chunked
