#include <cloak/anonymization/replacer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace cloak::anonymization {

nlohmann::json ReplacementInfo::toJson() const {
    nlohmann::json j{{"entities_processed", entitiesProcessed},
                     {"replacements_applied", replacementsApplied},
                     {"entities_skipped", entitiesSkipped},
                     {"consistency_enabled", consistencyEnabled},
                     {"strategies_used", strategiesUsed},
                     {"unique_replacements", uniqueReplacements}};
    if (!userDataLabels.empty()) {
        j["user_data_labels"] = userDataLabels;
    }
    return j;
}

nlohmann::json ReplacementResult::toJson() const {
    nlohmann::json replacements = nlohmann::json::array();
    for (const auto& d : details) {
        replacements.push_back(d.toJson());
    }
    return nlohmann::json{{"anonymized_text", anonymizedText},
                          {"replacements", std::move(replacements)},
                          {"replacement_map", replacementMap},
                          {"replacement_info", info.toJson()}};
}

nlohmann::json ReplacerStats::toJson() const {
    return nlohmann::json{{"cache_size", cacheSize},
                          {"consistency_enabled", consistencyEnabled},
                          {"synthetic_available", syntheticAvailable},
                          {"locale", locale},
                          {"cached_strategies", cachedStrategies},
                          {"available_strategies", availableStrategies}};
}

EntityReplacer::EntityReplacer(ReplacerConfig config,
                               std::shared_ptr<ISyntheticGenerator> generator,
                               std::optional<std::uint64_t> seed)
    : config_(std::move(config)),
      generator_(std::move(generator)),
      rng_(seed.value_or(std::random_device{}())),
      synthetic_(generator_),
      country_(rng_),
      date_(rng_, generator_),
      default_(rng_) {
    if (seed && generator_) {
        generator_->seed(*seed);
    }
    spdlog::debug("EntityReplacer initialized: locale={}, synthetic={}, consistency={}",
                  config_.locale, generator_ != nullptr, config_.ensureConsistency);
}

std::vector<StrategyKind> EntityReplacer::chainFor(std::string_view label) {
    using K = StrategyKind;
    if (label == "location") {
        return {K::Country, K::Synthetic, K::Default};
    }
    if (label == "date") {
        return {K::Date, K::Synthetic, K::Default};
    }
    if (label == "nationality" || label == "country") {
        return {K::Country, K::Default};
    }
    // person, organization, company, email, phone, address, age and anything unknown
    return {K::Synthetic, K::Default};
}

IReplacementStrategy& EntityReplacer::strategy(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Synthetic: return synthetic_;
        case StrategyKind::Country: return country_;
        case StrategyKind::Date: return date_;
        case StrategyKind::Default: return default_;
    }
    return default_;
}

Result<void> EntityReplacer::loadCountries(const std::filesystem::path& path) {
    return country_.loadFromFile(path);
}

std::pair<std::string, std::string>
EntityReplacer::replacementFor(const Span& span, const std::string& label, bool consistency,
                               std::optional<StrategyKind> forced) {
    const CacheKey key{label, span.text};
    if (consistency) {
        if (auto it = cache_.find(key); it != cache_.end()) {
            return {it->second.value, it->second.strategy + "_cached"};
        }
    }

    std::vector<StrategyKind> chain;
    if (forced) {
        chain = {*forced, StrategyKind::Default};
    } else {
        chain = chainFor(label);
    }

    for (auto kind : chain) {
        auto& s = strategy(kind);
        if (!s.canHandle(label)) {
            continue;
        }
        std::optional<std::string> value;
        try {
            value = s.generate(span);
        } catch (const std::exception& e) {
            spdlog::debug("Strategy {} failed for {}: {}", s.name(), label, e.what());
            continue;
        }
        if (value && !value->empty() && *value != span.text) {
            if (consistency) {
                cache_[key] = CachedValue{*value, s.name()};
            }
            return {std::move(*value), s.name()};
        }
    }

    auto fallback = default_.replacementFor(span);
    if (consistency) {
        cache_[key] = CachedValue{fallback, default_.name()};
    }
    return {std::move(fallback), default_.name()};
}

ReplacementResult EntityReplacer::replace(std::string_view text, const SpanList& spans,
                                          std::optional<bool> consistency,
                                          const StrategyOverrides& overrides) {
    const bool consistent = consistency.value_or(config_.ensureConsistency);

    ReplacementResult result;
    result.anonymizedText = std::string(text);
    result.info.entitiesProcessed = spans.size();
    result.info.consistencyEnabled = consistent;
    if (spans.empty()) {
        return result;
    }

    StrategyOverrides effective = config_.overrides;
    for (const auto& [label, kind] : overrides) {
        effective[toLower(label)] = kind;
    }

    spdlog::info("Starting replacement of {} entities (consistency: {})", spans.size(),
                 consistent);

    SpanList ordered = spans;
    sortByStart(ordered);

    std::size_t limit = text.size();
    for (std::size_t k = ordered.size(); k-- > 0;) {
        const auto& span = ordered[k];
        if (span.start >= span.end || span.end > limit) {
            spdlog::debug("Skipping span [{}, {}) outside text or overlapping a replacement",
                          span.start, span.end);
            ++result.info.entitiesSkipped;
            continue;
        }

        const auto label = toLower(trimCopy(span.label));
        std::optional<StrategyKind> forced;
        if (auto it = effective.find(label); it != effective.end()) {
            forced = it->second;
        }

        auto [value, strategyUsed] = replacementFor(span, label, consistent, forced);
        if (value.empty() || value == span.text) {
            spdlog::debug("No replacement for '{}' (label: {})", span.text, label);
            continue;
        }

        result.anonymizedText.replace(span.start, span.end - span.start, value);
        result.replacementMap[span.text] = value;
        spdlog::debug("Replaced '{}' -> '{}' using {}", span.text, value, strategyUsed);

        ReplacementDetail detail;
        detail.label = label;
        detail.original = span.text;
        detail.replacement = std::move(value);
        detail.start = span.start;
        detail.end = span.end;
        detail.score = span.score;
        detail.strategyUsed = std::move(strategyUsed);
        result.details.push_back(std::move(detail));

        limit = span.start;
    }

    std::reverse(result.details.begin(), result.details.end());

    std::set<std::string> unique;
    for (const auto& d : result.details) {
        ++result.info.strategiesUsed[d.strategyUsed];
        unique.insert(d.replacement);
    }
    result.info.replacementsApplied = result.details.size();
    result.info.uniqueReplacements = unique.size();

    spdlog::info("Replacement complete: {} replacements applied", result.details.size());
    return result;
}

std::string EntityReplacer::pickUserValue(const UserValue& value) {
    if (const auto* literal = std::get_if<std::string>(&value)) {
        return *literal;
    }
    const auto& choices = std::get<std::vector<std::string>>(value);
    if (choices.empty()) {
        return {};
    }
    std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
    return choices[dist(rng_)];
}

ReplacementResult EntityReplacer::replaceWithUserData(std::string_view text, const SpanList& spans,
                                                      const UserValueMap& userValues,
                                                      std::optional<bool> consistency) {
    const bool consistent = consistency.value_or(config_.ensureConsistency);

    ReplacementResult result;
    result.anonymizedText = std::string(text);
    result.info.entitiesProcessed = spans.size();
    result.info.consistencyEnabled = consistent;
    if (spans.empty() || userValues.empty()) {
        return result;
    }

    std::map<std::string, const UserValue*> byLabel;
    for (const auto& [label, value] : userValues) {
        byLabel[toLower(trimCopy(label))] = &value;
        result.info.userDataLabels.push_back(label);
    }

    spdlog::info("Starting user data replacement of {} entities", spans.size());

    SpanList ordered = spans;
    sortByStart(ordered);

    // Per-call cache; the instance cache only holds strategy-generated values
    std::map<CacheKey, std::string> callCache;
    std::size_t limit = text.size();
    for (std::size_t k = ordered.size(); k-- > 0;) {
        const auto& span = ordered[k];
        const auto label = toLower(trimCopy(span.label));
        auto it = byLabel.find(label);
        if (it == byLabel.end()) {
            continue;
        }
        if (span.start >= span.end || span.end > limit) {
            ++result.info.entitiesSkipped;
            continue;
        }

        std::string value;
        if (consistent) {
            const CacheKey key{label, span.text};
            if (auto cached = callCache.find(key); cached != callCache.end()) {
                value = cached->second;
            } else {
                value = pickUserValue(*it->second);
                callCache.emplace(key, value);
            }
        } else {
            value = pickUserValue(*it->second);
        }
        if (value.empty()) {
            continue;
        }

        result.anonymizedText.replace(span.start, span.end - span.start, value);
        result.replacementMap[span.text] = value;
        spdlog::debug("User replaced '{}' -> '{}'", span.text, value);

        ReplacementDetail detail;
        detail.label = label;
        detail.original = span.text;
        detail.replacement = std::move(value);
        detail.start = span.start;
        detail.end = span.end;
        detail.score = span.score;
        detail.strategyUsed = "user_data";
        result.details.push_back(std::move(detail));

        limit = span.start;
    }

    std::reverse(result.details.begin(), result.details.end());

    std::set<std::string> unique;
    for (const auto& d : result.details) {
        unique.insert(d.replacement);
    }
    result.info.replacementsApplied = result.details.size();
    result.info.uniqueReplacements = unique.size();
    if (!result.details.empty()) {
        result.info.strategiesUsed["user_data"] = result.details.size();
    }

    spdlog::info("User data replacement complete: {} replacements applied",
                 result.details.size());
    return result;
}

void EntityReplacer::clearCache() {
    cache_.clear();
    spdlog::debug("Replacement cache cleared");
}

ReplacerStats EntityReplacer::stats() const {
    ReplacerStats s;
    s.cacheSize = cache_.size();
    s.consistencyEnabled = config_.ensureConsistency;
    s.syntheticAvailable = generator_ != nullptr;
    s.locale = generator_ ? generator_->locale() : config_.locale;
    for (const auto& [_, cached] : cache_) {
        ++s.cachedStrategies[cached.strategy];
    }
    for (auto kind : {StrategyKind::Synthetic, StrategyKind::Country, StrategyKind::Date,
                      StrategyKind::Default}) {
        s.availableStrategies.emplace_back(strategyName(kind));
    }
    return s;
}

void EntityReplacer::seed(std::uint64_t value) {
    rng_.seed(value);
    if (generator_) {
        generator_->seed(value);
    }
}

} // namespace cloak::anonymization
