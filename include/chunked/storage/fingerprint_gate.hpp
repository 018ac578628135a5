#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunked::storage {

/**
 * @brief Per-fingerprint reader/writer arbitration without blocking
 *
 * Chunk uploads and single-chunk cleanups take a shared lease; a merge or an
 * abandon takes the exclusive lease. Acquisition never waits: a caller that
 * cannot get its lease reports the fingerprint as busy instead. Different
 * fingerprints never contend beyond the short registry lock.
 *
 * The gate must outlive every lease it hands out.
 */
class FingerprintGate {
public:
    /**
     * @brief RAII hold on one fingerprint; released on destruction
     */
    class Lease {
    public:
        Lease(FingerprintGate* gate, std::string fingerprint, bool exclusive)
            : gate_(gate), fingerprint_(std::move(fingerprint)), exclusive_(exclusive) {}

        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept
            : gate_(other.gate_),
              fingerprint_(std::move(other.fingerprint_)),
              exclusive_(other.exclusive_) {
            other.gate_ = nullptr;
        }

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = other.gate_;
                fingerprint_ = std::move(other.fingerprint_);
                exclusive_ = other.exclusive_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        void release() noexcept {
            if (gate_ != nullptr) {
                gate_->release(fingerprint_, exclusive_);
                gate_ = nullptr;
            }
        }

        [[nodiscard]] bool exclusive() const noexcept { return exclusive_; }
        [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }

    private:
        FingerprintGate* gate_;
        std::string fingerprint_;
        bool exclusive_;
    };

    FingerprintGate() = default;

    FingerprintGate(const FingerprintGate&) = delete;
    FingerprintGate& operator=(const FingerprintGate&) = delete;

    std::optional<Lease> try_shared(const std::string& fingerprint);
    std::optional<Lease> try_exclusive(const std::string& fingerprint);

    [[nodiscard]] bool is_exclusive(const std::string& fingerprint) const;
    [[nodiscard]] bool is_held(const std::string& fingerprint) const;

private:
    struct Entry {
        std::size_t shared = 0;
        bool exclusive = false;
    };

    void release(const std::string& fingerprint, bool exclusive) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace chunked::storage
