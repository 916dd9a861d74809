#pragma once

#include <cloak/entity/span.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace cloak::validation {

struct MergerConfig {
    // Largest byte gap between two same-label spans that still merges them
    std::size_t maxGap = 1;
};

struct MergeStats {
    std::size_t totalProcessed = 0;
    std::size_t totalMerged = 0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"total_processed", totalProcessed}, {"total_merged", totalMerged}};
    }
};

struct MergeSummary {
    std::size_t originalCount = 0;
    std::size_t mergedCount = 0;
    std::size_t entitiesMerged = 0;
    double reductionPercentage = 0.0;
    std::map<std::string, std::size_t> originalByLabel;
    std::map<std::string, std::size_t> mergedByLabel;
    MergeStats global;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"original_count", originalCount},
                              {"merged_count", mergedCount},
                              {"entities_merged", entitiesMerged},
                              {"reduction_percentage", reductionPercentage},
                              {"original_by_label", originalByLabel},
                              {"merged_by_label", mergedByLabel},
                              {"global_stats", global.toJson()}};
    }
};

/**
 * Coalesces same-label spans that touch or are separated by at most maxGap bytes.
 * Merged text is re-read from the source, and the score is the running mean of the
 * constituent scores.
 */
class EntityMerger {
public:
    explicit EntityMerger(MergerConfig config = {}) : config_(config) {}

    SpanList merge(const SpanList& spans, std::string_view sourceText);

    // True when b (starting at or after a) would be folded into a
    bool canMerge(const Span& a, const Span& b) const;

    MergeSummary summarize(const SpanList& original, const SpanList& merged) const;

    const MergeStats& getStats() const { return stats_; }
    void resetStats();

private:
    MergerConfig config_;
    MergeStats stats_;
};

} // namespace cloak::validation
