#pragma once

#include <cloak/core/types.h>
#include <cloak/extraction/labeler.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloak::extraction {

struct GazetteerConfig {
    // Consider multi-token phrases up to this n-gram size
    std::size_t max_ngram = 4;

    // Lowercase aliases and candidate phrases before lookup
    bool case_insensitive = true;

    bool is_valid() const { return max_ngram >= 1; }
};

// Surface form that maps to a label with a prior confidence
struct AliasEntry {
    std::string alias;
    std::string label;
    float score = 0.9f;
};

// Regular expression that tags every match with a label
struct PatternEntry {
    std::string label;
    std::string regex;
    float score = 0.8f;
};

/**
 * @brief Local dictionary and pattern based labeler.
 *
 * Alias matching is longest-first over word tokens (n-grams up to max_ngram), so a
 * shorter alias never claims a token already covered by a longer match. Pattern
 * matches are reported independently; overlaps between the two sources are left to
 * the validator.
 */
class GazetteerLabeler final : public ILabeler {
public:
    GazetteerLabeler() = default;
    explicit GazetteerLabeler(GazetteerConfig cfg) : config_(std::move(cfg)) {}

    Result<void> addAlias(const AliasEntry& entry);
    Result<void> addAliases(const std::vector<AliasEntry>& entries);
    Result<void> addPattern(const PatternEntry& entry);

    // Email, phone and numeric date patterns
    Result<void> addDefaultPatterns();

    // {"aliases":[{"alias","label","score"}], "patterns":[{"label","regex","score"}]}
    Result<void> loadFromJson(const nlohmann::json& doc);
    Result<void> loadFromFile(const std::filesystem::path& path);

    void clear();
    std::size_t aliasCount() const;
    std::size_t patternCount() const;

    Result<SpanList> label(std::string_view text, const std::vector<std::string>& labels,
                           float threshold) const override;

    std::string name() const override { return "gazetteer"; }
    nlohmann::json info() const override;

private:
    struct Token {
        std::string norm;
        std::size_t start;
        std::size_t end;
    };

    struct CompiledPattern {
        std::string label;
        std::string source;
        std::regex regex;
        float score;
    };

    using LabelPrior = std::pair<std::string, float>;

    std::string normalize(std::string_view s) const;
    std::vector<Token> tokenize(std::string_view text) const;
    std::optional<LabelPrior> lookupBest(const std::string& norm,
                                         const std::vector<std::string>& labels) const;

    GazetteerConfig config_{};
    std::unordered_map<std::string, std::vector<LabelPrior>> alias_map_;
    std::vector<CompiledPattern> patterns_;
    mutable std::shared_mutex mutex_;
};

} // namespace cloak::extraction
