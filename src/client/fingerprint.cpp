#include "chunked/client/fingerprint.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace chunked::client {

void Sha256Accumulator::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256Accumulator::Sha256Accumulator()
    : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        ctx_.reset();
    }
}

Result<void> Sha256Accumulator::update(const void* data, std::size_t size) {
    if (!ctx_) {
        return Err<void>(ErrorCode::IoFailure, "digest context unavailable");
    }
    if (finalized_) {
        return Err<void>(ErrorCode::InvalidArgument, "digest already finalized");
    }
    if (size > 0 && EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        return Err<void>(ErrorCode::IoFailure, "error updating digest");
    }
    return Ok();
}

Result<std::string> Sha256Accumulator::finalize() {
    if (!ctx_) {
        return Err<std::string>(ErrorCode::IoFailure, "digest context unavailable");
    }
    if (finalized_) {
        return Err<std::string>(ErrorCode::InvalidArgument, "digest already finalized");
    }
    finalized_ = true;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), md, &md_len) != 1) {
        return Err<std::string>(ErrorCode::IoFailure, "error finalizing digest");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < md_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return Ok(ss.str());
}

Result<std::string> fingerprint_file(const std::filesystem::path& path,
                                     const CancellationToken* cancel,
                                     std::size_t buffer_size) {
    if (buffer_size == 0) {
        return Err<std::string>(ErrorCode::InvalidArgument, "fingerprint buffer size must be positive");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>(ErrorCode::IoFailure, "cannot open " + path.string());
    }

    Sha256Accumulator digest;
    std::vector<char> buffer(buffer_size);
    std::uint64_t total = 0;

    while (file) {
        if (is_cancelled(cancel)) {
            return Err<std::string>(ErrorCode::Cancelled, "fingerprinting cancelled");
        }
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = file.gcount();
        if (got > 0) {
            if (auto res = digest.update(buffer.data(), static_cast<std::size_t>(got)); res.is_error()) {
                return Err<std::string>(res.error());
            }
            total += static_cast<std::uint64_t>(got);
        }
    }
    if (file.bad()) {
        return Err<std::string>(ErrorCode::IoFailure, "read error on " + path.string());
    }

    auto fingerprint = digest.finalize();
    if (fingerprint.is_ok()) {
        spdlog::debug("Fingerprint of {} ({} bytes): {}", path.string(), total, fingerprint.value());
    }
    return fingerprint;
}

Result<std::string> fingerprint_bytes(const void* data, std::size_t size) {
    Sha256Accumulator digest;
    if (auto res = digest.update(data, size); res.is_error()) {
        return Err<std::string>(res.error());
    }
    return digest.finalize();
}

} // namespace chunked::client
