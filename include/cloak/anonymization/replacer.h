#pragma once

#include <cloak/anonymization/replacement_strategy.h>
#include <cloak/anonymization/strategies/country_strategy.h>
#include <cloak/anonymization/strategies/date_strategy.h>
#include <cloak/anonymization/strategies/default_strategy.h>
#include <cloak/anonymization/strategies/synthetic_strategy.h>
#include <cloak/anonymization/synthetic_generator.h>
#include <cloak/core/types.h>
#include <cloak/entity/span.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cloak::anonymization {

// Per-label strategy override; replaces the label's chain (default still follows)
using StrategyOverrides = std::map<std::string, StrategyKind>;

// A literal value or a list to pick from uniformly
using UserValue = std::variant<std::string, std::vector<std::string>>;
using UserValueMap = std::map<std::string, UserValue>;

struct ReplacerConfig {
    std::string locale = "en_US";
    bool ensureConsistency = true;
    StrategyOverrides overrides;
};

struct ReplacementDetail {
    std::string label; // Lower-cased
    std::string original;
    std::string replacement;
    std::size_t start = 0;
    std::size_t end = 0;
    float score = 0.0f;
    std::string strategyUsed;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"label", label},
                              {"original", original},
                              {"replacement", replacement},
                              {"start", start},
                              {"end", end},
                              {"score", score},
                              {"strategy_used", strategyUsed}};
    }
};

struct ReplacementInfo {
    std::size_t entitiesProcessed = 0;
    std::size_t replacementsApplied = 0;
    std::size_t entitiesSkipped = 0;
    bool consistencyEnabled = true;
    std::map<std::string, std::size_t> strategiesUsed;
    std::size_t uniqueReplacements = 0;
    std::vector<std::string> userDataLabels; // Only for user-data replacement

    [[nodiscard]] nlohmann::json toJson() const;
};

struct ReplacementResult {
    std::string anonymizedText;
    std::vector<ReplacementDetail> details; // Sorted by start
    std::map<std::string, std::string> replacementMap; // original -> replacement
    ReplacementInfo info;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct ReplacerStats {
    std::size_t cacheSize = 0;
    bool consistencyEnabled = true;
    bool syntheticAvailable = false;
    std::string locale;
    std::map<std::string, std::size_t> cachedStrategies;
    std::vector<std::string> availableStrategies;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Irreversible replacement of spans with plausible values.
 *
 * Each label maps to an ordered chain of strategies; the first eligible strategy that
 * yields a non-empty value different from the original wins, and the default strategy
 * closes every chain. With consistency on, (label, original) pairs are cached for the
 * lifetime of the replacer and reused, tagged "<strategy>_cached".
 */
class EntityReplacer {
public:
    explicit EntityReplacer(ReplacerConfig config = {},
                            std::shared_ptr<ISyntheticGenerator> generator = nullptr,
                            std::optional<std::uint64_t> seed = std::nullopt);

    // Strategies hold a reference to rng_, so the replacer stays where it was built
    EntityReplacer(const EntityReplacer&) = delete;
    EntityReplacer& operator=(const EntityReplacer&) = delete;
    EntityReplacer(EntityReplacer&&) = delete;
    EntityReplacer& operator=(EntityReplacer&&) = delete;

    ReplacementResult replace(std::string_view text, const SpanList& spans,
                              std::optional<bool> consistency = std::nullopt,
                              const StrategyOverrides& overrides = {});

    ReplacementResult replaceWithUserData(std::string_view text, const SpanList& spans,
                                          const UserValueMap& userValues,
                                          std::optional<bool> consistency = std::nullopt);

    // Replace the built-in country list; see CountryStrategy::loadFromFile
    Result<void> loadCountries(const std::filesystem::path& path);

    // Chain used for a lower-cased label when no override applies
    static std::vector<StrategyKind> chainFor(std::string_view label);

    void clearCache();
    ReplacerStats stats() const;

    // Reseeds the replacer and its synthetic generator
    void seed(std::uint64_t value);

    const ReplacerConfig& getConfig() const { return config_; }

private:
    using CacheKey = std::pair<std::string, std::string>; // (label, original)
    struct CachedValue {
        std::string value;
        std::string strategy;
    };

    IReplacementStrategy& strategy(StrategyKind kind);
    std::pair<std::string, std::string> replacementFor(const Span& span, const std::string& label,
                                                       bool consistency,
                                                       std::optional<StrategyKind> forced);
    std::string pickUserValue(const UserValue& value);

    ReplacerConfig config_;
    std::shared_ptr<ISyntheticGenerator> generator_;
    RandomEngine rng_;

    SyntheticStrategy synthetic_;
    CountryStrategy country_;
    DateStrategy date_;
    DefaultStrategy default_;

    std::map<CacheKey, CachedValue> cache_;
};

} // namespace cloak::anonymization
