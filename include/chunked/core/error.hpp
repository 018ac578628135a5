#pragma once

#include <cstdint>
#include <string>

namespace chunked {

/**
 * @brief Failure categories shared by the server components and the client
 *
 * The client decides between retry, resume and give-up from the code alone,
 * so every storage or transport failure must be mapped to one of these.
 */
enum class ErrorCode {
    MissingIdentifier,   // fingerprint / index / artifact name absent
    InvalidArgument,     // present but malformed
    ChunkCountMismatch,  // stored chunk count != declared total at merge time
    ChunkTooLarge,       // chunk body above the configured maximum
    MergeInProgress,     // fingerprint is held exclusively by a merge
    IoFailure,           // disk read/write error
    Timeout,             // transfer or merge deadline expired
    Cancelled,           // cancellation token tripped or peer aborted
    Transport,           // client-side network failure
    Protocol             // unexpected or unparseable reply
};

struct Error {
    ErrorCode code = ErrorCode::IoFailure;
    std::string message;
    // Only meaningful for ChunkCountMismatch
    std::uint32_t expected = 0;
    std::uint32_t actual = 0;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Error count_mismatch(std::uint32_t expected_count, std::uint32_t actual_count) {
        Error error(ErrorCode::ChunkCountMismatch,
                    "chunk count mismatch: stored " + std::to_string(actual_count) +
                    " of " + std::to_string(expected_count));
        error.expected = expected_count;
        error.actual = actual_count;
        return error;
    }
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::MissingIdentifier: return "missing_identifier";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::ChunkCountMismatch: return "chunk_count_mismatch";
        case ErrorCode::ChunkTooLarge: return "chunk_too_large";
        case ErrorCode::MergeInProgress: return "merge_in_progress";
        case ErrorCode::IoFailure: return "io_failure";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Transport: return "transport";
        case ErrorCode::Protocol: return "protocol";
    }
    return "unknown";
}

/**
 * @brief Whether the same request may succeed if simply sent again
 */
inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::IoFailure ||
           code == ErrorCode::Timeout ||
           code == ErrorCode::Transport;
}

} // namespace chunked
