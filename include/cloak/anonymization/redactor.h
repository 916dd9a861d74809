#pragma once

#include <cloak/core/types.h>
#include <cloak/entity/span.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cloak::anonymization {

inline constexpr const char* DEFAULT_PLACEHOLDER_FORMAT = "#{id}_{label}_REDACTED";

struct RedactOptions {
    bool numbered = true;
    // Template with {id}, {label} and {count}; the redactor default when unset
    std::optional<std::string> format;
    bool consistentIds = true;
};

struct RedactionDetail {
    std::string label; // Upper-cased
    std::string original;
    std::string placeholder;
    std::size_t start = 0;
    std::size_t end = 0;
    float score = 0.0f;
    std::string redactionId;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"label", label},
                              {"original", original},
                              {"placeholder", placeholder},
                              {"start", start},
                              {"end", end},
                              {"score", score},
                              {"redaction_id", redactionId}};
    }
};

struct RedactionInfo {
    std::size_t entitiesProcessed = 0;
    std::size_t redactionsApplied = 0;
    std::size_t entitiesSkipped = 0;
    std::string formatUsed;
    bool numbered = true;
    bool consistentIds = true;
    std::size_t uniqueEntities = 0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"entities_processed", entitiesProcessed},
                              {"redactions_applied", redactionsApplied},
                              {"entities_skipped", entitiesSkipped},
                              {"format_used", formatUsed},
                              {"numbered_redaction", numbered},
                              {"consistent_ids", consistentIds},
                              {"unique_entities", uniqueEntities}};
    }
};

struct RedactionResult {
    std::string anonymizedText;
    std::vector<RedactionDetail> details; // Sorted by start
    std::map<std::string, std::string> reIdentificationMap; // placeholder -> original
    RedactionInfo info;

    [[nodiscard]] nlohmann::json toJson() const;
};

struct LabelRedactionStats {
    std::size_t uniqueEntities = 0;
    std::size_t maxIdUsed = 0;
};

struct RedactorStats {
    std::size_t totalUniqueEntities = 0;
    std::map<std::string, LabelRedactionStats> labels;
    std::string defaultFormat;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Reversible redaction with numbered placeholders.
 *
 * Ids are allocated per upper-cased label, smallest unused positive integer first.
 * Each redact() call numbers from 1; batchRedact() shares one assignment across all
 * texts. Spans are applied in descending start order so earlier offsets stay valid.
 */
class EntityRedactor {
public:
    explicit EntityRedactor(std::string defaultFormat = DEFAULT_PLACEHOLDER_FORMAT);

    Result<RedactionResult> redact(std::string_view text, const SpanList& spans,
                                   const RedactOptions& options = {});

    // spanLists[i] belongs to texts[i]
    Result<std::vector<RedactionResult>> batchRedact(const std::vector<std::string>& texts,
                                                     const std::vector<SpanList>& spanLists,
                                                     const RedactOptions& options = {});

    // Render one placeholder; InvalidArgument for a malformed template
    static Result<std::string> renderPlaceholder(const std::string& format, std::size_t id,
                                                 const std::string& label);

    void clearHistory();
    RedactorStats stats() const;

    const std::string& defaultFormat() const { return defaultFormat_; }

private:
    using EntityKey = std::pair<std::string, std::string>; // (LABEL, original text)
    using IdAssignment = std::map<EntityKey, std::size_t>;
    using UsedIds = std::map<std::string, std::set<std::size_t>>;

    static std::size_t allocateId(UsedIds& used, const std::string& label);
    static EntityKey keyOf(const Span& span);

    Result<RedactionResult> redactWith(std::string_view text, const SpanList& spans,
                                       const RedactOptions& options, const IdAssignment* ids);

    std::string defaultFormat_;
    // Accumulated across calls for stats(); cleared by clearHistory()
    UsedIds historyIds_;
    std::set<EntityKey> historyEntities_;
};

} // namespace cloak::anonymization
