#include <cloak/pipeline/cloak_context.h>
#include <cloak/version.hpp>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace cloak::pipeline {

namespace {

std::shared_ptr<const extraction::ILabeler>
requireLabeler(std::shared_ptr<const extraction::ILabeler> labeler) {
    if (!labeler) {
        throw std::invalid_argument("CloakContext requires a labeler");
    }
    return labeler;
}

} // namespace

nlohmann::json ProcessingInfo::toJson() const {
    nlohmann::json j{{"text_length", textLength},
                     {"word_count", wordCount},
                     {"processing_time", elapsedSeconds},
                     {"method_used", method},
                     {"passes_completed", passesCompleted},
                     {"raw_entities", rawEntityCount},
                     {"entities_found", entityCount},
                     {"labels_used", labels},
                     {"merge_applied", mergeApplied},
                     {"validation_applied", validationApplied},
                     {"overlap_resolution_applied", overlapResolutionApplied},
                     {"cache_hit", cacheHit}};
    if (validationStats) {
        j["validation_stats"] = validationStats->toJson();
    }
    if (dispatch) {
        j["parallel"] = dispatch->toJson();
    }
    if (cacheStats) {
        j["cache_stats"] = cacheStats->toJson();
    }
    return j;
}

nlohmann::json ExtractionResult::toJson() const {
    return nlohmann::json{{"version", CLOAK_VERSION_STRING},
                          {"entities", cloak::toJson(spans)},
                          {"processing_info", info.toJson()}};
}

nlohmann::json RedactOutcome::toJson() const {
    auto j = extraction.toJson();
    j["redaction"] = redaction.toJson();
    return j;
}

nlohmann::json ReplaceOutcome::toJson() const {
    auto j = extraction.toJson();
    j["replacement"] = replacement.toJson();
    return j;
}

CloakContext::CloakContext(config::CloakConfig config,
                           std::shared_ptr<const extraction::ILabeler> labeler,
                           std::shared_ptr<anonymization::ISyntheticGenerator> generator,
                           std::optional<std::uint64_t> seed)
    : config_(std::move(config)),
      labeler_(requireLabeler(std::move(labeler))),
      generator_(generator ? std::move(generator)
                           : std::make_shared<anonymization::BasicSyntheticGenerator>(
                                 config_.replacement.locale, seed)),
      extractor_(labeler_, extraction::MultiPassConfig{config_.extraction.maxPasses}),
      cache_(config_.extraction.useCache
                 ? std::make_unique<extraction::ExtractionCache>(
                       extraction::ExtractionCacheConfig{config_.extraction.cacheSize})
                 : nullptr),
      redactor_(config_.redaction.placeholderFormat),
      replacer_(config_.replacerConfig(), generator_, seed) {
    spdlog::debug("CloakContext initialized: labeler={}, cache={}, chunk_size={}, workers={}",
                  labeler_->name(), cache_ != nullptr, config_.extraction.chunkSize,
                  config_.extraction.workerCount);
}

Result<std::unique_ptr<CloakContext>>
CloakContext::create(config::CloakConfig config,
                     std::shared_ptr<const extraction::ILabeler> labeler,
                     std::shared_ptr<anonymization::ISyntheticGenerator> generator,
                     std::optional<std::uint64_t> seed) {
    if (!labeler) {
        return Error{ErrorCode::NotInitialized, "no labeler configured"};
    }
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }

    auto countries = config.replacement.countriesFile;
    auto ctx = std::make_unique<CloakContext>(std::move(config), std::move(labeler),
                                              std::move(generator), seed);
    if (countries) {
        if (auto loaded = ctx->replacer_.loadCountries(*countries); !loaded) {
            return loaded.error();
        }
    }
    return ctx;
}

std::vector<std::string> CloakContext::effectiveLabels(const std::vector<std::string>& labels) const {
    return extraction::prepareLabels(labels.empty() ? config_.extraction.labels : labels);
}

Result<ExtractionResult> CloakContext::extract(std::string_view text,
                                               const std::vector<std::string>& labels,
                                               const ExtractOverrides& overrides) {
    const auto started = std::chrono::steady_clock::now();
    const auto& settings = config_.extraction;

    ExtractionResult result;
    auto& info = result.info;
    info.textLength = text.size();
    info.labels = effectiveLabels(labels);

    if (isBlank(text)) {
        spdlog::warn("Empty text provided for extraction");
        return result;
    }

    const float minConfidence = overrides.minConfidence.value_or(settings.minConfidence);
    const auto chunkSize = overrides.chunkSize.value_or(settings.chunkSize);
    const auto workers = overrides.workerCount.value_or(settings.workerCount);
    const auto strategy = overrides.overlapStrategy.value_or(settings.overlapStrategy);
    if (minConfidence < 0.0f || minConfidence > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "min_confidence must be within [0, 1]"};
    }
    if (chunkSize == 0 || workers == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk size and worker count must be positive"};
    }

    info.wordCount = countWords(text);
    const bool parallel =
        overrides.parallel.value_or(extraction::ParallelDispatcher::shouldDispatch(text, chunkSize));

    spdlog::info("Extracting entities: {} chars, {} words, labels [{}], method {}", text.size(),
                 info.wordCount, fmt::join(info.labels, ", "),
                 parallel ? "parallel" : "single-pass");

    SpanList spans;
    if (parallel) {
        info.method = "parallel";
        extraction::ParallelDispatcher dispatcher(
            extraction::DispatchConfig{chunkSize, workers, minConfidence});
        auto dispatched = dispatcher.dispatch(text, *labeler_, info.labels);
        info.passesCompleted = dispatched.chunksSucceeded > 0 ? 1 : 0;
        spans = std::move(dispatched.spans);
        dispatched.spans.clear();
        info.dispatch = std::move(dispatched);
    } else {
        info.method = "single-pass";
        const auto passes = overrides.maxPasses.value_or(settings.maxPasses);
        auto run = [&]() { return extractor_.extract(text, info.labels, passes); };

        extraction::ExtractionOutcome outcome;
        if (cache_ && !overrides.maxPasses) {
            const auto hitsBefore = cache_->getStats().hits;
            outcome = cache_->getOrCompute(text, info.labels, run);
            info.cacheHit = cache_->getStats().hits > hitsBefore;
            info.cacheStats = cache_->getStats();
        } else {
            outcome = run();
        }
        info.passesCompleted = outcome.passesCompleted;
        spans = std::move(outcome.spans);
    }
    info.rawEntityCount = spans.size();

    if (settings.enableValidation && !spans.empty()) {
        validation::EntityValidator validator(
            validation::ValidatorConfig{minConfidence, settings.strictValidation});
        spans = validator.validate(spans, text, minConfidence);
        info.validationApplied = true;
        if (settings.resolveOverlaps) {
            spans = validator.resolveOverlaps(spans, strategy);
            info.overlapResolutionApplied = true;
        }
        info.validationStats = validator.getStats();
    }

    if (settings.mergeEntities && !spans.empty()) {
        spans = merger_.merge(spans, text);
        info.mergeApplied = true;
    }

    sortByStart(spans);
    result.spans = std::move(spans);
    info.entityCount = result.spans.size();
    info.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    spdlog::info("Extraction complete: {} entities in {:.3f}s", info.entityCount,
                 info.elapsedSeconds);
    return result;
}

Result<RedactOutcome> CloakContext::redact(std::string_view text,
                                           const std::vector<std::string>& labels,
                                           const ExtractOverrides& overrides) {
    auto extracted = extract(text, labels, overrides);
    if (!extracted) {
        return extracted.error();
    }
    auto redacted = redactSpans(text, extracted.value().spans);
    if (!redacted) {
        return redacted.error();
    }
    return RedactOutcome{std::move(extracted).value(), std::move(redacted).value()};
}

Result<ReplaceOutcome> CloakContext::replace(std::string_view text,
                                             const std::vector<std::string>& labels,
                                             const ExtractOverrides& overrides) {
    auto extracted = extract(text, labels, overrides);
    if (!extracted) {
        return extracted.error();
    }
    auto replaced = replaceSpans(text, extracted.value().spans);
    return ReplaceOutcome{std::move(extracted).value(), std::move(replaced)};
}

Result<ReplaceOutcome> CloakContext::replaceWithData(std::string_view text,
                                                     const std::vector<std::string>& labels,
                                                     const anonymization::UserValueMap& userValues,
                                                     const ExtractOverrides& overrides) {
    if (userValues.empty()) {
        return Error{ErrorCode::InvalidArgument, "user replacement values must not be empty"};
    }
    auto extracted = extract(text, labels, overrides);
    if (!extracted) {
        return extracted.error();
    }
    auto replaced = replacer_.replaceWithUserData(text, extracted.value().spans, userValues);
    return ReplaceOutcome{std::move(extracted).value(), std::move(replaced)};
}

Result<anonymization::RedactionResult> CloakContext::redactSpans(std::string_view text,
                                                                 const SpanList& spans) {
    return redactor_.redact(text, spans, config_.redactOptions());
}

anonymization::ReplacementResult CloakContext::replaceSpans(std::string_view text,
                                                            const SpanList& spans) {
    return replacer_.replace(text, spans);
}

void CloakContext::clearCache() {
    if (cache_) {
        cache_->clear();
    }
    replacer_.clearCache();
    redactor_.clearHistory();
    spdlog::info("Caches cleared");
}

nlohmann::json CloakContext::info() const {
    nlohmann::json j{{"version", CLOAK_VERSION_STRING},
                     {"labeler", labeler_->info()},
                     {"config", config_.toJson()},
                     {"replacer", replacer_.stats().toJson()},
                     {"redactor", redactor_.stats().toJson()}};
    if (cache_) {
        j["cache"] = cache_->getStats().toJson();
    }
    return j;
}

} // namespace cloak::pipeline
