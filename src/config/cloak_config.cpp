#include <cloak/config/cloak_config.h>

#include <spdlog/spdlog.h>

namespace cloak::config {

namespace {

Error keyError(const std::string& section, const std::string& key, const Error& cause) {
    return Error{ErrorCode::InvalidArgument,
                 "config [" + section + "] " + key + ": " + cause.message};
}

template <typename T, typename Parser>
Result<void> assign(const std::map<std::string, std::string>& values, const std::string& section,
                    const std::string& key, T& target, Parser parse) {
    auto it = values.find(key);
    if (it == values.end()) {
        return {};
    }
    auto parsed = parse(it->second);
    if (!parsed) {
        return keyError(section, key, parsed.error());
    }
    target = parsed.value();
    return {};
}

Result<std::string> parseString(const std::string& raw) {
    return raw;
}

Result<void> applyExtraction(const std::map<std::string, std::string>& v, ExtractionSettings& e) {
    const std::string s = "extraction";
    for (auto r : {assign(v, s, "min_confidence", e.minConfidence, parse_float),
                   assign(v, s, "max_passes", e.maxPasses, parse_size),
                   assign(v, s, "chunk_size", e.chunkSize, parse_size),
                   assign(v, s, "worker_count", e.workerCount, parse_size),
                   assign(v, s, "merge_entities", e.mergeEntities, parse_bool),
                   assign(v, s, "enable_validation", e.enableValidation, parse_bool),
                   assign(v, s, "resolve_overlaps", e.resolveOverlaps, parse_bool),
                   assign(v, s, "strict_validation", e.strictValidation, parse_bool),
                   assign(v, s, "use_cache", e.useCache, parse_bool),
                   assign(v, s, "cache_size", e.cacheSize, parse_size)}) {
        if (!r) {
            return r;
        }
    }

    if (auto it = v.find("overlap_strategy"); it != v.end()) {
        auto strategy = validation::parseOverlapStrategy(it->second);
        if (!strategy) {
            return keyError(s, "overlap_strategy", strategy.error());
        }
        e.overlapStrategy = strategy.value();
    }
    if (auto it = v.find("labels"); it != v.end()) {
        auto labels = parse_string_list(it->second);
        if (labels.empty()) {
            return keyError(s, "labels", Error{ErrorCode::InvalidArgument, "label list is empty"});
        }
        e.labels = std::move(labels);
    }
    return {};
}

Result<void> applyRedaction(const std::map<std::string, std::string>& v, RedactionSettings& r) {
    const std::string s = "redaction";
    for (auto res : {assign(v, s, "placeholder_format", r.placeholderFormat, parseString),
                     assign(v, s, "numbered", r.numbered, parse_bool),
                     assign(v, s, "consistent_ids", r.consistentIds, parse_bool)}) {
        if (!res) {
            return res;
        }
    }
    return {};
}

Result<void> applyReplacement(const std::map<std::string, std::string>& v,
                              ReplacementSettings& r) {
    const std::string s = "replacement";
    for (auto res : {assign(v, s, "locale", r.locale, parseString),
                     assign(v, s, "ensure_consistency", r.ensureConsistency, parse_bool)}) {
        if (!res) {
            return res;
        }
    }
    if (auto it = v.find("countries_file"); it != v.end() && !it->second.empty()) {
        r.countriesFile = expand_tilde(it->second);
    }
    return {};
}

} // namespace

Result<void> CloakConfig::validate() const {
    if (extraction.minConfidence < 0.0f || extraction.minConfidence > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "min_confidence must be within [0, 1]"};
    }
    if (extraction.maxPasses == 0) {
        return Error{ErrorCode::InvalidArgument, "max_passes must be at least 1"};
    }
    if (extraction.chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk_size must be at least 1"};
    }
    if (extraction.workerCount == 0) {
        return Error{ErrorCode::InvalidArgument, "worker_count must be at least 1"};
    }
    if (extraction.useCache && extraction.cacheSize == 0) {
        return Error{ErrorCode::InvalidArgument, "cache_size must be at least 1"};
    }
    if (redaction.numbered) {
        auto probe = anonymization::EntityRedactor::renderPlaceholder(redaction.placeholderFormat,
                                                                      1, "LABEL");
        if (!probe) {
            return probe.error();
        }
    }
    return {};
}

nlohmann::json CloakConfig::toJson() const {
    nlohmann::json overrides = nlohmann::json::object();
    for (const auto& [label, kind] : replacement.overrides) {
        overrides[label] = anonymization::strategyName(kind);
    }
    return nlohmann::json{
        {"extraction",
         {{"min_confidence", extraction.minConfidence},
          {"max_passes", extraction.maxPasses},
          {"chunk_size", extraction.chunkSize},
          {"worker_count", extraction.workerCount},
          {"merge_entities", extraction.mergeEntities},
          {"enable_validation", extraction.enableValidation},
          {"resolve_overlaps", extraction.resolveOverlaps},
          {"strict_validation", extraction.strictValidation},
          {"overlap_strategy", validation::overlapStrategyName(extraction.overlapStrategy)},
          {"use_cache", extraction.useCache},
          {"cache_size", extraction.cacheSize},
          {"labels", extraction.labels}}},
        {"redaction",
         {{"placeholder_format", redaction.placeholderFormat},
          {"numbered", redaction.numbered},
          {"consistent_ids", redaction.consistentIds}}},
        {"replacement",
         {{"locale", replacement.locale},
          {"ensure_consistency", replacement.ensureConsistency},
          {"countries_file",
           replacement.countriesFile ? replacement.countriesFile->string() : std::string()},
          {"overrides", std::move(overrides)}}}};
}

anonymization::RedactOptions CloakConfig::redactOptions() const {
    anonymization::RedactOptions opts;
    opts.numbered = redaction.numbered;
    opts.format = redaction.placeholderFormat;
    opts.consistentIds = redaction.consistentIds;
    return opts;
}

anonymization::ReplacerConfig CloakConfig::replacerConfig() const {
    anonymization::ReplacerConfig cfg;
    cfg.locale = replacement.locale;
    cfg.ensureConsistency = replacement.ensureConsistency;
    cfg.overrides = replacement.overrides;
    return cfg;
}

Result<CloakConfig> applySections(const ConfigSections& sections, CloakConfig base) {
    for (const auto& [section, values] : sections) {
        Result<void> applied;
        if (section == "extraction") {
            applied = applyExtraction(values, base.extraction);
        } else if (section == "redaction") {
            applied = applyRedaction(values, base.redaction);
        } else if (section == "replacement") {
            applied = applyReplacement(values, base.replacement);
        } else if (section == "replacement.overrides") {
            for (const auto& [label, name] : values) {
                auto kind = anonymization::parseStrategyKind(name);
                if (!kind) {
                    return keyError(section, label, kind.error());
                }
                base.replacement.overrides[toLower(label)] = kind.value();
            }
        } else {
            spdlog::debug("Ignoring unknown config section [{}]", section);
        }
        if (!applied) {
            return applied.error();
        }
    }

    if (auto valid = base.validate(); !valid) {
        return valid.error();
    }
    return base;
}

Result<CloakConfig> loadConfigFromString(std::string_view toml) {
    return applySections(parse_config_text(toml));
}

Result<CloakConfig> loadConfig(const std::string& overridePath) {
    const auto path = get_config_path(overridePath);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!overridePath.empty()) {
            return Error{ErrorCode::FileNotFound, "config file not found: " + path.string()};
        }
        spdlog::debug("No config file at {}, using defaults", path.string());
        return CloakConfig{};
    }

    auto sections = parse_config_file(path);
    if (!sections) {
        return sections.error();
    }
    spdlog::debug("Loaded config from {}", path.string());
    return applySections(sections.value());
}

} // namespace cloak::config
