#include <cloak/extraction/extraction_cache.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace cloak::extraction {

CacheKey CacheKey::from(std::string_view text, const std::vector<std::string>& labels) {
    std::vector<std::string> sorted = labels;
    std::sort(sorted.begin(), sorted.end());

    CacheKey key;
    key.keyString_.reserve(text.size() + 16 * sorted.size());
    // Unit separator keeps "ab"+"c" distinct from "a"+"bc"
    for (const auto& l : sorted) {
        key.keyString_.append(l);
        key.keyString_.push_back('\x1f');
    }
    key.keyString_.push_back('\x1e');
    key.keyString_.append(text);
    key.hashValue_ = std::hash<std::string>{}(key.keyString_);
    return key;
}

ExtractionCache::ExtractionCache(const ExtractionCacheConfig& config) : config_(config) {
    if (config_.maxEntries == 0) {
        config_.maxEntries = 1;
    }
}

std::optional<ExtractionOutcome> ExtractionCache::get(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        if (config_.enableStatistics)
            misses_.fetch_add(1);
        return std::nullopt;
    }
    moveToFrontLocked(key);
    if (config_.enableStatistics)
        hits_.fetch_add(1);
    return it->second;
}

void ExtractionCache::put(const CacheKey& key, const ExtractionOutcome& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    insertLocked(key, value);
}

ExtractionOutcome ExtractionCache::getOrCompute(std::string_view text,
                                                const std::vector<std::string>& labels,
                                                const Loader& loader) {
    const auto key = CacheKey::from(text, labels);

    std::promise<ExtractionOutcome> promise;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            moveToFrontLocked(key);
            if (config_.enableStatistics)
                hits_.fetch_add(1);
            return it->second;
        }

        auto pending = inflight_.find(key);
        if (pending != inflight_.end()) {
            auto shared = pending->second;
            lock.unlock();
            if (config_.enableStatistics)
                hits_.fetch_add(1);
            spdlog::debug("Extraction cache: waiting on in-flight computation");
            return shared.get();
        }

        inflight_.emplace(key, promise.get_future().share());
        if (config_.enableStatistics)
            misses_.fetch_add(1);
    }

    ExtractionOutcome value;
    try {
        value = loader();
    } catch (...) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        inflight_.erase(key);
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (value.labelerErrors == 0) {
            insertLocked(key, value);
        }
        inflight_.erase(key);
    }
    promise.set_value(value);
    return value;
}

bool ExtractionCache::contains(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.find(key) != cache_.end();
}

void ExtractionCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    keyToListIter_.clear();
    lruList_.clear();
    hits_.store(0);
    misses_.store(0);
    evictions_.store(0);
    spdlog::debug("Extraction cache cleared");
}

size_t ExtractionCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

ExtractionCacheStats ExtractionCache::getStats() const {
    ExtractionCacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.maxSize = config_.maxEntries;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.currentSize = cache_.size();
    return stats;
}

void ExtractionCache::resetStats() {
    hits_.store(0);
    misses_.store(0);
    evictions_.store(0);
}

void ExtractionCache::insertLocked(const CacheKey& key, const ExtractionOutcome& value) {
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second = value;
        moveToFrontLocked(key);
        return;
    }

    while (cache_.size() >= config_.maxEntries) {
        evictLocked();
    }

    cache_.emplace(key, value);
    lruList_.push_front(key);
    keyToListIter_[key] = lruList_.begin();
}

void ExtractionCache::moveToFrontLocked(const CacheKey& key) {
    auto it = keyToListIter_.find(key);
    if (it == keyToListIter_.end()) {
        return;
    }
    lruList_.splice(lruList_.begin(), lruList_, it->second);
    it->second = lruList_.begin();
}

void ExtractionCache::evictLocked() {
    if (lruList_.empty()) {
        return;
    }
    const auto victim = lruList_.back();
    lruList_.pop_back();
    keyToListIter_.erase(victim);
    cache_.erase(victim);
    evictions_.fetch_add(1);
}

} // namespace cloak::extraction
