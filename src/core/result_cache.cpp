#include "result_cache.h"
#include "output_layout.h"
#include "../utils/checksum.h"
#include "../utils/logging.h"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

bool describeArtifactFile(const fs::path& path, int slideIndex, CachedArtifact& out) {
    uint32_t crc = 0;
    if (!crc32File(path, crc)) {
        return false;
    }
    out.slide_index = slideIndex;
    out.path = path;
    out.checksum = toHex32(crc);
    out.last_write_time = fileTimestamp(path);
    return true;
}

bool verifyCacheEntry(const CacheEntry& entry, std::string& reason) {
    if (entry.artifacts.empty()) {
        reason = "entry has no artifacts";
        return false;
    }
    for (const auto& artifact : entry.artifacts) {
        std::error_code ec;
        if (!fs::is_regular_file(artifact.path, ec)) {
            reason = artifact.path.string() + " is missing";
            return false;
        }
        uint32_t crc = 0;
        if (!crc32File(artifact.path, crc)) {
            reason = artifact.path.string() + " cannot be read";
            return false;
        }
        if (toHex32(crc) != artifact.checksum) {
            reason = artifact.path.string() + " was modified (checksum " + toHex32(crc) +
                     ", expected " + artifact.checksum + ")";
            return false;
        }
    }
    return true;
}

static json entryToJson(const CacheEntry& entry) {
    json artifacts = json::array();
    for (const auto& a : entry.artifacts) {
        artifacts.push_back({
            {"slide_index", a.slide_index},
            {"path", a.path.string()},
            {"checksum", a.checksum},
            {"last_write_time", a.last_write_time},
        });
    }
    return {
        {"format", formatName(entry.format)},
        {"presentation_id", entry.presentation_id},
        {"artifacts", artifacts},
    };
}

static CacheEntry entryFromJson(const std::string& key, const json& j) {
    CacheEntry entry;
    entry.key = key;
    entry.format = parseExportFormat(j.at("format").get<std::string>());
    entry.presentation_id = j.value("presentation_id", "");
    for (const auto& a : j.at("artifacts")) {
        CachedArtifact artifact;
        artifact.slide_index = a.value("slide_index", -1);
        artifact.path = a.at("path").get<std::string>();
        artifact.checksum = a.at("checksum").get<std::string>();
        artifact.last_write_time = a.value("last_write_time", static_cast<int64_t>(0));
        entry.artifacts.push_back(std::move(artifact));
    }
    return entry;
}

JsonCacheStore::JsonCacheStore(fs::path indexPath) : indexPath_(std::move(indexPath)) {}

bool JsonCacheStore::load(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    if (indexPath_.empty()) {
        return true;
    }
    std::error_code ec;
    if (!fs::exists(indexPath_, ec)) {
        return true;
    }

    std::ifstream f(indexPath_);
    if (!f.is_open()) {
        error = "cannot open cache index " + indexPath_.string();
        return false;
    }
    try {
        json j = json::parse(f);
        const json& entries = j.at("entries");
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            entries_[it.key()] = entryFromJson(it.key(), it.value());
        }
    } catch (const std::exception& e) {
        // Covers nlohmann parse/type errors and unknown format tags
        entries_.clear();
        error = "cache index " + indexPath_.string() + " is unreadable: " + e.what();
        return false;
    }
    LOG_DEBUG("Loaded " << entries_.size() << " cache entries from " << indexPath_.string());
    return true;
}

std::optional<CacheEntry> JsonCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonCacheStore::put(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[entry.key] = entry;
    persistLocked();
}

void JsonCacheStore::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(key) > 0) {
        persistLocked();
    }
}

size_t JsonCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void JsonCacheStore::persistLocked() {
    if (indexPath_.empty()) {
        return;
    }
    json entries = json::object();
    for (const auto& [key, entry] : entries_) {
        entries[key] = entryToJson(entry);
    }
    json root = {{"version", 1}, {"entries", entries}};
    std::string text = root.dump(2);

    std::string error;
    if (!writeFileAtomic(indexPath_, text.data(), text.size(), error)) {
        // The in-memory index stays authoritative for this run
        LOG_CERR("[WARNING] Failed to persist cache index: " << error);
    }
}
