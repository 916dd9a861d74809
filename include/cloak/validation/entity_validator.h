#pragma once

#include <cloak/core/types.h>
#include <cloak/entity/span.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cloak::validation {

// Spans longer than this many bytes are rejected as implausible
inline constexpr std::size_t MAX_ENTITY_LENGTH = 200;

enum class OverlapStrategy { HighestConfidence, Longest, First };

constexpr const char* overlapStrategyName(OverlapStrategy s) {
    switch (s) {
        case OverlapStrategy::HighestConfidence: return "highest_confidence";
        case OverlapStrategy::Longest: return "longest";
        case OverlapStrategy::First: return "first";
    }
    return "highest_confidence";
}

Result<OverlapStrategy> parseOverlapStrategy(std::string_view name);

struct ValidatorConfig {
    float minConfidence = 0.3f;
    // Position and text-consistency checks run only in strict mode
    bool strictValidation = true;
};

struct ValidationStats {
    std::size_t totalEntities = 0;
    std::size_t confidenceFiltered = 0;
    std::size_t positionInvalid = 0;
    std::size_t textMismatch = 0;
    std::size_t validEntities = 0;

    double confidenceFilterRate() const { return rate(confidenceFiltered); }
    double positionInvalidRate() const { return rate(positionInvalid); }
    double textMismatchRate() const { return rate(textMismatch); }
    double validationSuccessRate() const { return rate(validEntities); }

    [[nodiscard]] nlohmann::json toJson() const {
        nlohmann::json j{{"total_entities", totalEntities},
                         {"confidence_filtered", confidenceFiltered},
                         {"position_invalid", positionInvalid},
                         {"text_mismatch", textMismatch},
                         {"valid_entities", validEntities}};
        if (totalEntities > 0) {
            j["confidence_filter_rate"] = confidenceFilterRate();
            j["position_invalid_rate"] = positionInvalidRate();
            j["text_mismatch_rate"] = textMismatchRate();
            j["validation_success_rate"] = validationSuccessRate();
        }
        return j;
    }

private:
    double rate(std::size_t n) const {
        return totalEntities > 0 ? static_cast<double>(n) / static_cast<double>(totalEntities)
                                 : 0.0;
    }
};

/**
 * @brief Filters raw spans and resolves overlaps.
 *
 * validate() applies, in order: confidence threshold, position bounds and text
 * consistency against the source. The first failing check is counted in the stats
 * and the span is dropped. Surviving spans are cleaned (text re-read from the source
 * and trimmed, label lower-cased).
 */
class EntityValidator {
public:
    explicit EntityValidator(ValidatorConfig config = {});

    SpanList validate(const SpanList& spans, std::string_view sourceText,
                      std::optional<float> minConfidence = std::nullopt);

    // Survivors keep their input order; no two survivors overlap
    SpanList resolveOverlaps(const SpanList& spans,
                             OverlapStrategy strategy = OverlapStrategy::HighestConfidence) const;

    // Index pairs (i < j) of overlapping spans
    static std::vector<std::pair<std::size_t, std::size_t>> detectOverlaps(const SpanList& spans);

    bool checkConfidence(const Span& span, float minConfidence) const;
    bool checkPosition(const Span& span, std::string_view sourceText) const;
    bool checkTextConsistency(const Span& span, std::string_view sourceText) const;

    const ValidationStats& getStats() const { return stats_; }
    const ValidatorConfig& getConfig() const { return config_; }

private:
    Span clean(const Span& span, std::string_view sourceText) const;

    ValidatorConfig config_;
    ValidationStats stats_;
};

} // namespace cloak::validation
