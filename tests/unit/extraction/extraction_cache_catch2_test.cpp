// Catch2 tests for the extraction LRU cache

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <cloak/extraction/extraction_cache.h>

#include "../../common/fake_labelers.h"

using namespace cloak;
using namespace cloak::extraction;

namespace {
ExtractionOutcome outcomeWith(std::size_t spans, std::size_t errors = 0) {
    ExtractionOutcome o;
    for (std::size_t i = 0; i < spans; ++i) {
        o.spans.push_back(Span{"person", "p", i, i + 1, 0.9f});
    }
    o.passesCompleted = 1;
    o.labelerErrors = errors;
    return o;
}
} // namespace

TEST_CASE("ExtractionCache - KeyIgnoresLabelOrder", "[extraction][cache][catch2]") {
    auto a = CacheKey::from("same text", {"person", "date"});
    auto b = CacheKey::from("same text", {"date", "person"});
    auto c = CacheKey::from("same text", {"person"});
    auto d = CacheKey::from("other text", {"person", "date"});
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);
}

TEST_CASE("ExtractionCache - PutGetAndStats", "[extraction][cache][catch2]") {
    ExtractionCache cache(ExtractionCacheConfig{4});
    auto key = CacheKey::from("Bob", {"person"});

    CHECK_FALSE(cache.get(key).has_value());
    cache.put(key, outcomeWith(2));
    auto hit = cache.get(key);
    REQUIRE(hit.has_value());
    CHECK(hit->spans.size() == 2);
    CHECK(cache.contains(key));

    auto stats = cache.getStats();
    CHECK(stats.hits == 1);
    CHECK(stats.misses == 1);
    CHECK(stats.currentSize == 1);
    CHECK(stats.maxSize == 4);
    CHECK(stats.hitRate() == 0.5);

    cache.resetStats();
    CHECK(cache.getStats().totalRequests() == 0);
    CHECK(cache.size() == 1);
}

TEST_CASE("ExtractionCache - EvictsLeastRecentlyUsed", "[extraction][cache][catch2]") {
    ExtractionCache cache(ExtractionCacheConfig{2});
    auto k1 = CacheKey::from("one", {"person"});
    auto k2 = CacheKey::from("two", {"person"});
    auto k3 = CacheKey::from("three", {"person"});

    cache.put(k1, outcomeWith(1));
    cache.put(k2, outcomeWith(1));
    REQUIRE(cache.get(k1).has_value()); // k1 is now most recent
    cache.put(k3, outcomeWith(1));

    CHECK(cache.size() == 2);
    CHECK(cache.contains(k1));
    CHECK_FALSE(cache.contains(k2));
    CHECK(cache.contains(k3));
    CHECK(cache.getStats().evictions == 1);
}

TEST_CASE("ExtractionCache - GetOrComputeRunsLoaderOnce", "[extraction][cache][catch2]") {
    ExtractionCache cache;
    int loads = 0;
    auto loader = [&]() {
        ++loads;
        return outcomeWith(3);
    };

    auto first = cache.getOrCompute("Alice", {"person"}, loader);
    auto second = cache.getOrCompute("Alice", {"person"}, loader);
    CHECK(loads == 1);
    CHECK(first.spans == second.spans);
    CHECK(cache.getStats().hits == 1);
    CHECK(cache.getStats().misses == 1);
}

TEST_CASE("ExtractionCache - OutcomesWithErrorsAreNotStored", "[extraction][cache][catch2]") {
    ExtractionCache cache;
    int loads = 0;
    auto loader = [&]() {
        ++loads;
        return outcomeWith(1, 1);
    };

    auto first = cache.getOrCompute("Alice", {"person"}, loader);
    CHECK(first.labelerErrors == 1);
    cache.getOrCompute("Alice", {"person"}, loader);
    CHECK(loads == 2);
    CHECK(cache.size() == 0);
}

TEST_CASE("ExtractionCache - LoaderExceptionPropagates", "[extraction][cache][catch2]") {
    ExtractionCache cache;
    auto failing = []() -> ExtractionOutcome { throw std::runtime_error("boom"); };
    CHECK_THROWS_AS(cache.getOrCompute("Alice", {"person"}, failing), std::runtime_error);

    // The key is not left in flight
    auto ok = cache.getOrCompute("Alice", {"person"}, []() { return outcomeWith(1); });
    CHECK(ok.spans.size() == 1);
    CHECK(cache.size() == 1);
}

TEST_CASE("ExtractionCache - ConcurrentCallersShareOneComputation",
          "[extraction][cache][concurrency][catch2]") {
    ExtractionCache cache;
    auto labeler = std::make_shared<cloak::test::SlowCountingLabeler>(
        std::chrono::milliseconds(100));
    MultiPassExtractor extractor(labeler, MultiPassConfig{1});

    const std::string text = "Zara and friends";
    const std::vector<std::string> labels{"person"};
    std::atomic<int> withSpans{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto outcome = cache.getOrCompute(text, labels,
                                              [&]() { return extractor.extract(text, labels); });
            if (outcome.spans.size() == 1) {
                ++withSpans;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(labeler->calls() == 1);
    CHECK(withSpans.load() == 8);
    auto stats = cache.getStats();
    CHECK(stats.misses == 1);
    CHECK(stats.hits == 7);
}

TEST_CASE("ExtractionCache - ClearEmptiesAndResets", "[extraction][cache][catch2]") {
    ExtractionCache cache;
    cache.put(CacheKey::from("x", {}), outcomeWith(1));
    REQUIRE(cache.get(CacheKey::from("x", {})).has_value());
    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(cache.getStats().hits == 0);
}
