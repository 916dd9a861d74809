#include <cloak/anonymization/redactor.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace cloak::anonymization {

nlohmann::json RedactionResult::toJson() const {
    nlohmann::json replacements = nlohmann::json::array();
    for (const auto& d : details) {
        replacements.push_back(d.toJson());
    }
    return nlohmann::json{{"anonymized_text", anonymizedText},
                          {"replacements", std::move(replacements)},
                          {"re_identification_map", reIdentificationMap},
                          {"redaction_info", info.toJson()}};
}

nlohmann::json RedactorStats::toJson() const {
    nlohmann::json perLabel = nlohmann::json::object();
    for (const auto& [label, s] : labels) {
        perLabel[label] = {{"unique_entities", s.uniqueEntities}, {"max_id_used", s.maxIdUsed}};
    }
    return nlohmann::json{{"total_unique_entities", totalUniqueEntities},
                          {"labels_processed", labels.size()},
                          {"label_statistics", std::move(perLabel)},
                          {"default_format", defaultFormat}};
}

EntityRedactor::EntityRedactor(std::string defaultFormat)
    : defaultFormat_(std::move(defaultFormat)) {
    spdlog::debug("EntityRedactor initialized with format: {}", defaultFormat_);
}

Result<std::string> EntityRedactor::renderPlaceholder(const std::string& format, std::size_t id,
                                                      const std::string& label) {
    try {
        return fmt::format(fmt::runtime(format), fmt::arg("id", id), fmt::arg("label", label),
                           fmt::arg("count", id));
    } catch (const fmt::format_error& e) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid placeholder format '" + format + "': " + e.what()};
    }
}

std::size_t EntityRedactor::allocateId(UsedIds& used, const std::string& label) {
    auto& ids = used[label];
    std::size_t candidate = 1;
    while (ids.count(candidate)) {
        ++candidate;
    }
    ids.insert(candidate);
    return candidate;
}

EntityRedactor::EntityKey EntityRedactor::keyOf(const Span& span) {
    return {toUpper(span.label), span.text};
}

Result<RedactionResult> EntityRedactor::redact(std::string_view text, const SpanList& spans,
                                               const RedactOptions& options) {
    return redactWith(text, spans, options, nullptr);
}

Result<RedactionResult> EntityRedactor::redactWith(std::string_view text, const SpanList& spans,
                                                   const RedactOptions& options,
                                                   const IdAssignment* ids) {
    const std::string format = options.format.value_or(defaultFormat_);

    RedactionResult result;
    result.anonymizedText = std::string(text);
    result.info.entitiesProcessed = spans.size();
    result.info.formatUsed = format;
    result.info.numbered = options.numbered;
    result.info.consistentIds = options.consistentIds;

    if (options.numbered) {
        auto probe = renderPlaceholder(format, 1, "LABEL");
        if (!probe) {
            return probe.error();
        }
    }
    if (spans.empty()) {
        return result;
    }

    spdlog::info("Starting redaction of {} entities", spans.size());

    SpanList ordered = spans;
    sortByStart(ordered);

    // Ids are fixed in ascending position order before any text is rewritten
    UsedIds used;
    IdAssignment assignment;
    if (ids) {
        assignment = *ids;
        for (const auto& [key, id] : assignment) {
            used[key.first].insert(id);
        }
    }
    std::vector<std::size_t> spanIds(ordered.size(), 0);
    if (options.numbered) {
        for (std::size_t i = 0; i < ordered.size(); ++i) {
            const auto key = keyOf(ordered[i]);
            if (options.consistentIds) {
                auto it = assignment.find(key);
                if (it == assignment.end()) {
                    it = assignment.emplace(key, allocateId(used, key.first)).first;
                }
                spanIds[i] = it->second;
            } else {
                spanIds[i] = allocateId(used, key.first);
            }
        }
    }

    std::size_t limit = text.size();
    for (std::size_t k = ordered.size(); k-- > 0;) {
        const auto& span = ordered[k];
        if (span.start >= span.end || span.end > text.size()) {
            spdlog::debug("Skipping span [{}, {}) outside text of length {}", span.start,
                          span.end, text.size());
            ++result.info.entitiesSkipped;
            continue;
        }
        if (span.end > limit) {
            spdlog::debug("Skipping span [{}, {}) overlapping an applied redaction", span.start,
                          span.end);
            ++result.info.entitiesSkipped;
            continue;
        }

        RedactionDetail detail;
        detail.label = toUpper(span.label);
        detail.original = span.text;
        detail.start = span.start;
        detail.end = span.end;
        detail.score = span.score;

        if (options.numbered) {
            auto placeholder = renderPlaceholder(format, spanIds[k], detail.label);
            if (!placeholder) {
                return placeholder.error();
            }
            detail.placeholder = std::move(placeholder).value();
            detail.redactionId = std::to_string(spanIds[k]);
            historyIds_[detail.label].insert(spanIds[k]);
            historyEntities_.insert(keyOf(span));
        } else {
            detail.placeholder = detail.label + "_REDACTED";
            detail.redactionId = detail.label + "_STATIC";
        }

        result.anonymizedText.replace(span.start, span.end - span.start, detail.placeholder);
        result.reIdentificationMap[detail.placeholder] = detail.original;
        spdlog::debug("Redacted '{}' -> '{}'", detail.original, detail.placeholder);

        limit = span.start;
        result.details.push_back(std::move(detail));
    }

    std::reverse(result.details.begin(), result.details.end());

    std::set<EntityKey> unique;
    for (const auto& d : result.details) {
        unique.emplace(d.label, d.original);
    }
    result.info.redactionsApplied = result.details.size();
    result.info.uniqueEntities = unique.size();

    spdlog::info("Redaction complete: {} redactions applied", result.details.size());
    return result;
}

Result<std::vector<RedactionResult>>
EntityRedactor::batchRedact(const std::vector<std::string>& texts,
                            const std::vector<SpanList>& spanLists, const RedactOptions& options) {
    if (texts.size() != spanLists.size()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Number of texts ({}) must match number of span lists ({})",
                                 texts.size(), spanLists.size())};
    }

    spdlog::info("Starting batch redaction of {} texts", texts.size());

    UsedIds used;
    IdAssignment global;
    for (const auto& spans : spanLists) {
        SpanList ordered = spans;
        sortByStart(ordered);
        for (const auto& span : ordered) {
            const auto key = keyOf(span);
            if (!global.count(key)) {
                global.emplace(key, allocateId(used, key.first));
            }
        }
    }

    std::vector<RedactionResult> results;
    results.reserve(texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i) {
        auto r = redactWith(texts[i], spanLists[i], options, &global);
        if (!r) {
            return r.error();
        }
        results.push_back(std::move(r).value());
        spdlog::debug("Completed redaction for text {}/{}", i + 1, texts.size());
    }

    spdlog::info("Batch redaction complete");
    return results;
}

void EntityRedactor::clearHistory() {
    historyIds_.clear();
    historyEntities_.clear();
    spdlog::debug("Redaction history cleared");
}

RedactorStats EntityRedactor::stats() const {
    RedactorStats s;
    s.totalUniqueEntities = historyEntities_.size();
    s.defaultFormat = defaultFormat_;
    for (const auto& [label, ids] : historyIds_) {
        LabelRedactionStats ls;
        ls.uniqueEntities = ids.size();
        ls.maxIdUsed = ids.empty() ? 0 : *ids.rbegin();
        s.labels.emplace(label, ls);
    }
    return s;
}

} // namespace cloak::anonymization
