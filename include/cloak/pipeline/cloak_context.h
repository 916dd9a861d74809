#pragma once

#include <cloak/anonymization/redactor.h>
#include <cloak/anonymization/replacer.h>
#include <cloak/anonymization/synthetic_generator.h>
#include <cloak/config/cloak_config.h>
#include <cloak/core/types.h>
#include <cloak/entity/span.h>
#include <cloak/extraction/extraction_cache.h>
#include <cloak/extraction/labeler.h>
#include <cloak/extraction/multi_pass_extractor.h>
#include <cloak/extraction/parallel_dispatcher.h>
#include <cloak/validation/entity_merger.h>
#include <cloak/validation/entity_validator.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloak::pipeline {

// Per-call adjustments on top of CloakConfig::extraction
struct ExtractOverrides {
    // Force the parallel (true) or multi-pass (false) path; auto-select when unset
    std::optional<bool> parallel;
    std::optional<float> minConfidence;
    std::optional<std::size_t> chunkSize;
    std::optional<std::size_t> workerCount;
    std::optional<std::size_t> maxPasses;
    std::optional<validation::OverlapStrategy> overlapStrategy;
};

struct ProcessingInfo {
    std::size_t textLength = 0;
    std::size_t wordCount = 0;
    double elapsedSeconds = 0.0;
    std::string method = "none"; // parallel, single-pass or none
    std::size_t passesCompleted = 0;
    std::size_t rawEntityCount = 0;
    std::size_t entityCount = 0;
    std::vector<std::string> labels;
    bool mergeApplied = false;
    bool validationApplied = false;
    bool overlapResolutionApplied = false;
    bool cacheHit = false;
    std::optional<validation::ValidationStats> validationStats;
    std::optional<extraction::DispatchResult> dispatch;
    std::optional<extraction::ExtractionCacheStats> cacheStats;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct ExtractionResult {
    SpanList spans;
    ProcessingInfo info;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct RedactOutcome {
    ExtractionResult extraction;
    anonymization::RedactionResult redaction;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct ReplaceOutcome {
    ExtractionResult extraction;
    anonymization::ReplacementResult replacement;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Caller-owned pipeline: extraction, validation, merging and anonymization.
 *
 * Holds the labeler, the extraction cache and the redactor/replacer whose identity
 * maps live as long as the context. Not safe for concurrent use from several threads.
 */
class CloakContext {
public:
    // Throws std::invalid_argument when labeler is null. A null generator is replaced
    // by a BasicSyntheticGenerator for the configured locale.
    CloakContext(config::CloakConfig config, std::shared_ptr<const extraction::ILabeler> labeler,
                 std::shared_ptr<anonymization::ISyntheticGenerator> generator = nullptr,
                 std::optional<std::uint64_t> seed = std::nullopt);

    CloakContext(const CloakContext&) = delete;
    CloakContext& operator=(const CloakContext&) = delete;
    CloakContext(CloakContext&&) = delete;
    CloakContext& operator=(CloakContext&&) = delete;

    // Validates the config and loads the countries file when one is configured
    static Result<std::unique_ptr<CloakContext>>
    create(config::CloakConfig config, std::shared_ptr<const extraction::ILabeler> labeler,
           std::shared_ptr<anonymization::ISyntheticGenerator> generator = nullptr,
           std::optional<std::uint64_t> seed = std::nullopt);

    Result<ExtractionResult> extract(std::string_view text,
                                     const std::vector<std::string>& labels = {},
                                     const ExtractOverrides& overrides = {});

    Result<RedactOutcome> redact(std::string_view text, const std::vector<std::string>& labels = {},
                                 const ExtractOverrides& overrides = {});

    Result<ReplaceOutcome> replace(std::string_view text,
                                   const std::vector<std::string>& labels = {},
                                   const ExtractOverrides& overrides = {});

    // InvalidArgument for an empty value map
    Result<ReplaceOutcome> replaceWithData(std::string_view text,
                                           const std::vector<std::string>& labels,
                                           const anonymization::UserValueMap& userValues,
                                           const ExtractOverrides& overrides = {});

    // Anonymize spans produced elsewhere
    Result<anonymization::RedactionResult> redactSpans(std::string_view text,
                                                       const SpanList& spans);
    anonymization::ReplacementResult replaceSpans(std::string_view text, const SpanList& spans);

    void clearCache();
    [[nodiscard]] nlohmann::json info() const;

    const config::CloakConfig& config() const { return config_; }
    anonymization::EntityRedactor& redactor() { return redactor_; }
    anonymization::EntityReplacer& replacer() { return replacer_; }
    const extraction::ExtractionCache* cache() const { return cache_.get(); }

private:
    std::vector<std::string> effectiveLabels(const std::vector<std::string>& labels) const;

    config::CloakConfig config_;
    std::shared_ptr<const extraction::ILabeler> labeler_;
    std::shared_ptr<anonymization::ISyntheticGenerator> generator_;
    extraction::MultiPassExtractor extractor_;
    std::unique_ptr<extraction::ExtractionCache> cache_;
    validation::EntityMerger merger_;
    anonymization::EntityRedactor redactor_;
    anonymization::EntityReplacer replacer_;
};

} // namespace cloak::pipeline
