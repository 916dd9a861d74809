#include <cloak/validation/entity_merger.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cloak::validation {

bool EntityMerger::canMerge(const Span& a, const Span& b) const {
    return a.label == b.label && (b.start == a.end || b.start <= a.end + config_.maxGap);
}

SpanList EntityMerger::merge(const SpanList& spans, std::string_view sourceText) {
    if (spans.empty()) {
        return {};
    }

    SpanList sorted = spans;
    sortByStart(sorted);

    SpanList merged;
    Span current = sorted.front();
    std::size_t count = 1;

    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const auto& next = sorted[i];
        if (canMerge(current, next)) {
            // A span nested inside the current one never shrinks it
            const auto end = std::max(current.end, next.end);
            if (end <= sourceText.size()) {
                current.text = trimCopy(sourceText.substr(current.start, end - current.start));
            }
            current.end = end;
            current.score = (current.score * static_cast<float>(count) + next.score) /
                            static_cast<float>(count + 1);
            ++count;
            spdlog::debug("Merged entities: '{}' (count: {})", current.text, count);
        } else {
            merged.push_back(std::move(current));
            current = next;
            count = 1;
        }
    }
    merged.push_back(std::move(current));

    stats_.totalProcessed += spans.size();
    stats_.totalMerged += spans.size() - merged.size();

    spdlog::info("Entity merging complete: {} -> {} entities", spans.size(), merged.size());
    return merged;
}

MergeSummary EntityMerger::summarize(const SpanList& original, const SpanList& merged) const {
    MergeSummary summary;
    summary.originalCount = original.size();
    summary.mergedCount = merged.size();
    summary.entitiesMerged = original.size() >= merged.size() ? original.size() - merged.size() : 0;
    summary.reductionPercentage =
        original.empty() ? 0.0
                         : static_cast<double>(summary.entitiesMerged) * 100.0 /
                               static_cast<double>(original.size());
    for (const auto& s : original) {
        ++summary.originalByLabel[s.label];
    }
    for (const auto& s : merged) {
        ++summary.mergedByLabel[s.label];
    }
    summary.global = stats_;
    return summary;
}

void EntityMerger::resetStats() {
    stats_ = MergeStats{};
    spdlog::debug("Merge statistics reset");
}

} // namespace cloak::validation
