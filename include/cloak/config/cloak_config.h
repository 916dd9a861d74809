#pragma once

#include <cloak/anonymization/redactor.h>
#include <cloak/anonymization/replacer.h>
#include <cloak/chunking/word_chunker.h>
#include <cloak/config/config_helpers.h>
#include <cloak/core/types.h>
#include <cloak/validation/entity_validator.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloak::config {

struct ExtractionSettings {
    float minConfidence = 0.3f;
    std::size_t maxPasses = 2;
    std::size_t chunkSize = chunking::DEFAULT_MAX_WORDS;
    std::size_t workerCount = 4;
    bool mergeEntities = true;
    bool enableValidation = true;
    bool resolveOverlaps = true;
    bool strictValidation = true;
    validation::OverlapStrategy overlapStrategy = validation::OverlapStrategy::HighestConfidence;
    bool useCache = true;
    std::size_t cacheSize = 128;
    std::vector<std::string> labels = defaultLabels();
};

struct RedactionSettings {
    std::string placeholderFormat = anonymization::DEFAULT_PLACEHOLDER_FORMAT;
    bool numbered = true;
    bool consistentIds = true;
};

struct ReplacementSettings {
    std::string locale = "en_US";
    bool ensureConsistency = true;
    anonymization::StrategyOverrides overrides;
    std::optional<std::filesystem::path> countriesFile;
};

/**
 * Full pipeline configuration. Every key is optional; a missing file yields the
 * defaults below.
 *
 *   [extraction]  min_confidence, max_passes, chunk_size, worker_count,
 *                 merge_entities, enable_validation, resolve_overlaps,
 *                 strict_validation, overlap_strategy, use_cache, cache_size, labels
 *   [redaction]   placeholder_format, numbered, consistent_ids
 *   [replacement] locale, ensure_consistency, countries_file
 *   [replacement.overrides]  <label> = synthetic|country|date|default
 */
struct CloakConfig {
    ExtractionSettings extraction;
    RedactionSettings redaction;
    ReplacementSettings replacement;

    // Range checks that the parser cannot express per key
    Result<void> validate() const;

    [[nodiscard]] nlohmann::json toJson() const;

    anonymization::RedactOptions redactOptions() const;
    anonymization::ReplacerConfig replacerConfig() const;
};

// Apply parsed sections on top of `base`; unknown keys are ignored with a debug log
Result<CloakConfig> applySections(const ConfigSections& sections, CloakConfig base = {});

Result<CloakConfig> loadConfigFromString(std::string_view toml);

// Explicit path must exist; the default location may be absent
Result<CloakConfig> loadConfig(const std::string& overridePath = "");

} // namespace cloak::config
