#include <cloak/validation/entity_validator.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <unordered_set>

namespace cloak::validation {

Result<OverlapStrategy> parseOverlapStrategy(std::string_view name) {
    const auto key = toLower(trimCopy(name));
    if (key == "highest_confidence") {
        return OverlapStrategy::HighestConfidence;
    }
    if (key == "longest") {
        return OverlapStrategy::Longest;
    }
    if (key == "first") {
        return OverlapStrategy::First;
    }
    return Error{ErrorCode::InvalidArgument,
                 "Unknown overlap strategy '" + std::string(name) +
                     "' (expected highest_confidence, longest or first)"};
}

EntityValidator::EntityValidator(ValidatorConfig config) : config_(config) {
    spdlog::debug("EntityValidator initialized: min_confidence={}, strict={}",
                  config_.minConfidence, config_.strictValidation);
}

bool EntityValidator::checkConfidence(const Span& span, float minConfidence) const {
    return std::isfinite(span.score) && span.score >= minConfidence;
}

bool EntityValidator::checkPosition(const Span& span, std::string_view sourceText) const {
    const auto n = sourceText.size();
    if (span.start >= n || span.end > n) {
        return false;
    }
    if (span.start >= span.end) {
        return false;
    }
    return span.end - span.start <= MAX_ENTITY_LENGTH;
}

bool EntityValidator::checkTextConsistency(const Span& span, std::string_view sourceText) const {
    if (span.end > sourceText.size() || span.start > span.end) {
        return false;
    }
    const auto stored = normalizeWhitespace(span.text);
    const auto actual = normalizeWhitespace(sourceText.substr(span.start, span.end - span.start));

    if (stored == actual) {
        return true;
    }
    if (toLower(stored) == toLower(actual)) {
        return true;
    }
    // Tokenizers may include or drop a neighbouring character
    return actual.find(stored) != std::string::npos || stored.find(actual) != std::string::npos;
}

Span EntityValidator::clean(const Span& span, std::string_view sourceText) const {
    Span out = span;
    if (config_.strictValidation && span.end <= sourceText.size() && span.start < span.end) {
        out.text = trimCopy(sourceText.substr(span.start, span.end - span.start));
    }
    out.label = toLower(trimCopy(span.label));
    out.score = static_cast<float>(span.score);
    return out;
}

SpanList EntityValidator::validate(const SpanList& spans, std::string_view sourceText,
                                   std::optional<float> minConfidence) {
    stats_ = ValidationStats{};
    if (spans.empty()) {
        return {};
    }

    const float threshold = minConfidence.value_or(config_.minConfidence);
    stats_.totalEntities = spans.size();
    spdlog::info("Validating {} entities (min_confidence={})", spans.size(), threshold);

    SpanList validated;
    validated.reserve(spans.size());
    for (const auto& span : spans) {
        if (!checkConfidence(span, threshold)) {
            ++stats_.confidenceFiltered;
            continue;
        }
        if (config_.strictValidation && !checkPosition(span, sourceText)) {
            ++stats_.positionInvalid;
            continue;
        }
        if (config_.strictValidation && !checkTextConsistency(span, sourceText)) {
            ++stats_.textMismatch;
            continue;
        }
        validated.push_back(clean(span, sourceText));
    }
    stats_.validEntities = validated.size();

    spdlog::info("Validation complete: {}/{} entities passed", validated.size(), spans.size());
    if (stats_.confidenceFiltered > 0)
        spdlog::debug(" - Filtered by confidence: {}", stats_.confidenceFiltered);
    if (stats_.positionInvalid > 0)
        spdlog::debug(" - Invalid positions: {}", stats_.positionInvalid);
    if (stats_.textMismatch > 0)
        spdlog::debug(" - Text mismatches: {}", stats_.textMismatch);

    return validated;
}

std::vector<std::pair<std::size_t, std::size_t>>
EntityValidator::detectOverlaps(const SpanList& spans) {
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        for (std::size_t j = i + 1; j < spans.size(); ++j) {
            if (spans[i].overlaps(spans[j])) {
                pairs.emplace_back(i, j);
            }
        }
    }
    return pairs;
}

SpanList EntityValidator::resolveOverlaps(const SpanList& spans, OverlapStrategy strategy) const {
    if (spans.empty()) {
        return {};
    }

    const auto pairs = detectOverlaps(spans);
    if (pairs.empty()) {
        return spans;
    }

    spdlog::info("Resolving {} overlapping entity pairs using '{}' strategy", pairs.size(),
                 overlapStrategyName(strategy));

    std::unordered_set<std::size_t> removed;
    for (const auto& [i, j] : pairs) {
        if (removed.count(i) || removed.count(j)) {
            continue;
        }
        const auto& a = spans[i];
        const auto& b = spans[j];
        switch (strategy) {
            case OverlapStrategy::HighestConfidence:
                removed.insert(b.score > a.score ? i : j);
                break;
            case OverlapStrategy::Longest:
                removed.insert(b.length() > a.length() ? i : j);
                break;
            case OverlapStrategy::First:
                removed.insert(j);
                break;
        }
    }

    SpanList resolved;
    resolved.reserve(spans.size() - removed.size());
    for (std::size_t k = 0; k < spans.size(); ++k) {
        if (!removed.count(k)) {
            resolved.push_back(spans[k]);
        }
    }

    spdlog::info("Overlap resolution: {} -> {} entities", spans.size(), resolved.size());
    return resolved;
}

} // namespace cloak::validation
