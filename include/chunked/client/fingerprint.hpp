#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace chunked::client {

constexpr std::size_t kFingerprintBufferBytes = 1024 * 1024;

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface
 *
 * finalize() may be called once; afterwards update() and finalize() fail.
 */
class Sha256Accumulator {
public:
    Sha256Accumulator();

    Sha256Accumulator(const Sha256Accumulator&) = delete;
    Sha256Accumulator& operator=(const Sha256Accumulator&) = delete;
    Sha256Accumulator(Sha256Accumulator&&) noexcept = default;
    Sha256Accumulator& operator=(Sha256Accumulator&&) noexcept = default;

    Result<void> update(const void* data, std::size_t size);

    /// Lowercase hex digest (64 chars)
    Result<std::string> finalize();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

/**
 * @brief Content fingerprint of a whole file
 *
 * Streams the file through a buffer of `buffer_size` bytes, so memory use is
 * bounded regardless of file size. The token is checked between reads.
 *
 * ERRORS: IoFailure (unreadable), Cancelled, InvalidArgument (zero buffer)
 */
Result<std::string> fingerprint_file(const std::filesystem::path& path,
                                     const CancellationToken* cancel = nullptr,
                                     std::size_t buffer_size = kFingerprintBufferBytes);

/// Fingerprint of an in-memory buffer
Result<std::string> fingerprint_bytes(const void* data, std::size_t size);

} // namespace chunked::client
