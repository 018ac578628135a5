#include "chunked/core/identifiers.hpp"

#include <cctype>
#include <limits>

namespace chunked {

Result<void> validate_fingerprint(const std::string& fingerprint) {
    if (fingerprint.empty()) {
        return Err<void>(ErrorCode::MissingIdentifier, "fingerprint required");
    }
    if (fingerprint.size() > kMaxFingerprintLength) {
        return Err<void>(ErrorCode::InvalidArgument, "fingerprint too long");
    }
    for (char c : fingerprint) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            return Err<void>(ErrorCode::InvalidArgument,
                             "fingerprint contains invalid character");
        }
    }
    return Ok();
}

Result<std::uint32_t> parse_chunk_index(const std::string& text) {
    if (text.empty()) {
        return Err<std::uint32_t>(ErrorCode::MissingIdentifier, "chunk index required");
    }
    if (text.size() > 10) {
        return Err<std::uint32_t>(ErrorCode::InvalidArgument, "chunk index out of range: " + text);
    }

    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Err<std::uint32_t>(ErrorCode::InvalidArgument, "chunk index is not a number: " + text);
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::uint32_t>(ErrorCode::InvalidArgument, "chunk index out of range: " + text);
    }
    return Ok(static_cast<std::uint32_t>(value));
}

Result<void> validate_artifact_name(const std::string& name) {
    if (name.empty()) {
        return Err<void>(ErrorCode::MissingIdentifier, "artifact name required");
    }
    if (name.size() > kMaxArtifactNameLength) {
        return Err<void>(ErrorCode::InvalidArgument, "artifact name too long");
    }
    if (name == "." || name == "..") {
        return Err<void>(ErrorCode::InvalidArgument, "artifact name must be a file name");
    }
    // Leading dot is reserved for the catalog and in-progress merge files
    if (name.front() == '.') {
        return Err<void>(ErrorCode::InvalidArgument, "artifact name must not start with '.'");
    }
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            return Err<void>(ErrorCode::InvalidArgument, "artifact name must not contain a path separator");
        }
    }
    return Ok();
}

std::string artifact_location(const std::string& name) {
    return "/uploads/" + name;
}

} // namespace chunked
