#include "chunked/storage/fingerprint_gate.hpp"

namespace chunked::storage {

std::optional<FingerprintGate::Lease> FingerprintGate::try_shared(const std::string& fingerprint) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[fingerprint];
    if (entry.exclusive) {
        return std::nullopt;
    }
    ++entry.shared;
    return std::optional<Lease>(std::in_place, this, fingerprint, false);
}

std::optional<FingerprintGate::Lease> FingerprintGate::try_exclusive(const std::string& fingerprint) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[fingerprint];
    if (entry.exclusive || entry.shared > 0) {
        return std::nullopt;
    }
    entry.exclusive = true;
    return std::optional<Lease>(std::in_place, this, fingerprint, true);
}

bool FingerprintGate::is_exclusive(const std::string& fingerprint) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(fingerprint);
    return it != entries_.end() && it->second.exclusive;
}

bool FingerprintGate::is_held(const std::string& fingerprint) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(fingerprint);
    return it != entries_.end() && (it->second.exclusive || it->second.shared > 0);
}

void FingerprintGate::release(const std::string& fingerprint, bool exclusive) noexcept {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
        return;
    }
    if (exclusive) {
        it->second.exclusive = false;
    } else if (it->second.shared > 0) {
        --it->second.shared;
    }
    if (!it->second.exclusive && it->second.shared == 0) {
        entries_.erase(it);
    }
}

} // namespace chunked::storage
