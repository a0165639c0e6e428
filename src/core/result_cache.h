#ifndef RESULT_CACHE_H
#define RESULT_CACHE_H

#include "export_format.h"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct CachedArtifact {
    int slide_index = -1;
    std::filesystem::path path;
    std::string checksum;          // CRC-32, 8 hex digits
    int64_t last_write_time = 0;
};

// Artifacts of one format produced under one options key
struct CacheEntry {
    std::string key;
    ExportFormat format = ExportFormat::kPng;
    std::string presentation_id;
    std::vector<CachedArtifact> artifacts;
};

// Checksum and timestamp a freshly written file. Returns false if it cannot be read
bool describeArtifactFile(const std::filesystem::path& path, int slideIndex, CachedArtifact& out);

// True while every artifact exists and still has its recorded checksum.
// reason names the first artifact that failed.
bool verifyCacheEntry(const CacheEntry& entry, std::string& reason);

// Cache index. Implementations are shared by all exporter threads.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<CacheEntry> get(const std::string& key) = 0;
    virtual void put(const CacheEntry& entry) = 0;
    virtual void invalidate(const std::string& key) = 0;
};

// Index kept in memory and, when a path is given, rewritten atomically
// to a JSON file after every change
class JsonCacheStore : public CacheStore {
public:
    explicit JsonCacheStore(std::filesystem::path indexPath = {});

    // Read the index file. A missing file is an empty cache; an unreadable one
    // is reported and the cache starts empty.
    bool load(std::string& error);

    std::optional<CacheEntry> get(const std::string& key) override;
    void put(const CacheEntry& entry) override;
    void invalidate(const std::string& key) override;

    size_t size() const;
    const std::filesystem::path& indexPath() const { return indexPath_; }

private:
    void persistLocked();

    std::filesystem::path indexPath_;
    std::map<std::string, CacheEntry> entries_;
    mutable std::mutex mutex_;
};

#endif // RESULT_CACHE_H
