#pragma once

#include <cloak/extraction/multi_pass_extractor.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cloak::extraction {

/**
 * @brief Cache key built from the text and the sorted label set
 */
class CacheKey {
public:
    static CacheKey from(std::string_view text, const std::vector<std::string>& labels);

    CacheKey() = default;

    size_t hash() const { return hashValue_; }
    const std::string& toString() const { return keyString_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    std::string keyString_;
    size_t hashValue_ = 0;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

struct ExtractionCacheConfig {
    size_t maxEntries = 128;
    bool enableStatistics = true;
};

struct ExtractionCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    size_t currentSize = 0;
    size_t maxSize = 0;

    uint64_t totalRequests() const { return hits + misses; }

    double hitRate() const {
        const auto total = totalRequests();
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"cache_hits", hits},
                              {"cache_misses", misses},
                              {"total_requests", totalRequests()},
                              {"evictions", evictions},
                              {"current_size", currentSize},
                              {"max_size", maxSize},
                              {"hit_rate", hitRate()}};
    }
};

/**
 * @brief Thread-safe LRU cache in front of the single-pass extraction call.
 *
 * Concurrent getOrCompute() calls for the same key share one computation: the first
 * caller runs the loader, later callers wait on its shared future.
 */
class ExtractionCache {
public:
    using Loader = std::function<ExtractionOutcome()>;

    explicit ExtractionCache(const ExtractionCacheConfig& config = {});

    std::optional<ExtractionOutcome> get(const CacheKey& key);
    void put(const CacheKey& key, const ExtractionOutcome& value);

    // Outcomes that recorded labeler errors are returned but never stored
    ExtractionOutcome getOrCompute(std::string_view text, const std::vector<std::string>& labels,
                                   const Loader& loader);

    bool contains(const CacheKey& key) const;
    void clear();
    size_t size() const;

    ExtractionCacheStats getStats() const;
    void resetStats();

    const ExtractionCacheConfig& getConfig() const { return config_; }

private:
    using ListIterator = std::list<CacheKey>::iterator;

    // Callers must hold the unique lock
    void insertLocked(const CacheKey& key, const ExtractionOutcome& value);
    void moveToFrontLocked(const CacheKey& key);
    void evictLocked();

    mutable std::shared_mutex mutex_;
    ExtractionCacheConfig config_;

    std::list<CacheKey> lruList_;
    std::unordered_map<CacheKey, ListIterator, CacheKeyHash> keyToListIter_;
    std::unordered_map<CacheKey, ExtractionOutcome, CacheKeyHash> cache_;
    std::unordered_map<CacheKey, std::shared_future<ExtractionOutcome>, CacheKeyHash> inflight_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace cloak::extraction
