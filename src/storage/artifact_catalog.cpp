#include "chunked/storage/artifact_catalog.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace chunked::storage {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json entry_to_json(const CatalogEntry& entry) {
    json j;
    j["fingerprint"] = entry.fingerprint;
    j["artifact_name"] = entry.artifact_name;
    j["size"] = entry.size;
    j["assembled_at"] = entry.assembled_at;
    return j;
}

} // namespace

ArtifactCatalog::ArtifactCatalog(fs::path artifacts_root)
    : root_(std::move(artifacts_root)) {
}

fs::path ArtifactCatalog::artifact_path(const std::string& artifact_name) const {
    return root_ / artifact_name;
}

bool ArtifactCatalog::artifact_present(const std::string& artifact_name) const {
    std::error_code ec;
    return fs::is_regular_file(artifact_path(artifact_name), ec);
}

Result<void> ArtifactCatalog::load() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        return Err<void>(ErrorCode::IoFailure, "failed to create artifacts root " + root_.string() + ": " + ec.message());
    }

    const auto catalog_path = root_ / kCatalogFileName;
    if (!fs::exists(catalog_path, ec)) {
        return Ok();
    }

    std::ifstream input(catalog_path, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::IoFailure, "failed to open catalog " + catalog_path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("artifacts") || !doc["artifacts"].is_array()) {
        return Err<void>(ErrorCode::IoFailure, "catalog is corrupt: " + catalog_path.string());
    }

    std::lock_guard lock(mutex_);
    by_fingerprint_.clear();
    fingerprint_by_name_.clear();

    std::size_t dropped = 0;
    for (const auto& item : doc["artifacts"]) {
        CatalogEntry entry;
        entry.fingerprint = item.value("fingerprint", "");
        entry.artifact_name = item.value("artifact_name", "");
        entry.size = item.value("size", static_cast<std::uint64_t>(0));
        entry.assembled_at = item.value("assembled_at", static_cast<std::int64_t>(0));

        if (entry.fingerprint.empty() || entry.artifact_name.empty() || !artifact_present(entry.artifact_name)) {
            ++dropped;
            continue;
        }
        fingerprint_by_name_[entry.artifact_name] = entry.fingerprint;
        by_fingerprint_[entry.fingerprint] = std::move(entry);
    }

    spdlog::info("Artifact catalog loaded: {} entries ({} stale dropped)", by_fingerprint_.size(), dropped);
    return Ok();
}

std::optional<CatalogEntry> ArtifactCatalog::find_by_fingerprint(const std::string& fingerprint) const {
    std::lock_guard lock(mutex_);
    auto it = by_fingerprint_.find(fingerprint);
    if (it == by_fingerprint_.end() || !artifact_present(it->second.artifact_name)) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CatalogEntry> ArtifactCatalog::find_by_name(const std::string& artifact_name) const {
    std::lock_guard lock(mutex_);
    auto name_it = fingerprint_by_name_.find(artifact_name);
    if (name_it == fingerprint_by_name_.end()) {
        return std::nullopt;
    }
    auto it = by_fingerprint_.find(name_it->second);
    if (it == by_fingerprint_.end() || !artifact_present(artifact_name)) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> ArtifactCatalog::record(const CatalogEntry& entry) {
    std::lock_guard lock(mutex_);
    record_locked(entry);
    return persist_locked();
}

Result<void> ArtifactCatalog::publish(const fs::path& temp_path, const CatalogEntry& entry) {
    std::lock_guard lock(mutex_);

    const auto final_path = artifact_path(entry.artifact_name);
    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        return Err<void>(ErrorCode::IoFailure,
                         "failed to publish artifact " + final_path.string() + ": " + ec.message());
    }

    record_locked(entry);
    if (auto saved = persist_locked(); saved.is_error()) {
        spdlog::warn("Artifact {} published but catalog not saved: {}", entry.artifact_name, saved.error().message);
    }
    return Ok();
}

void ArtifactCatalog::record_locked(const CatalogEntry& entry) {
    // The name now holds different content: forget whoever held it before
    auto previous_owner = fingerprint_by_name_.find(entry.artifact_name);
    if (previous_owner != fingerprint_by_name_.end() && previous_owner->second != entry.fingerprint) {
        by_fingerprint_.erase(previous_owner->second);
    }
    // The content moves to a new name: the old name is no longer its artifact
    auto previous_entry = by_fingerprint_.find(entry.fingerprint);
    if (previous_entry != by_fingerprint_.end() && previous_entry->second.artifact_name != entry.artifact_name) {
        fingerprint_by_name_.erase(previous_entry->second.artifact_name);
    }

    by_fingerprint_[entry.fingerprint] = entry;
    fingerprint_by_name_[entry.artifact_name] = entry.fingerprint;
}

std::size_t ArtifactCatalog::size() const {
    std::lock_guard lock(mutex_);
    return by_fingerprint_.size();
}

Result<void> ArtifactCatalog::persist_locked() const {
    json doc;
    doc["artifacts"] = json::array();
    for (const auto& [fingerprint, entry] : by_fingerprint_) {
        doc["artifacts"].push_back(entry_to_json(entry));
    }

    const auto final_path = root_ / kCatalogFileName;
    auto temp_path = final_path;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorCode::IoFailure, "failed to write catalog " + temp_path.string());
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            return Err<void>(ErrorCode::IoFailure, "failed to write catalog " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return Err<void>(ErrorCode::IoFailure, "failed to replace catalog " + final_path.string());
    }
    return Ok();
}

} // namespace chunked::storage
