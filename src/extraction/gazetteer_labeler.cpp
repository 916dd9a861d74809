#include <cloak/extraction/gazetteer_labeler.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>

namespace cloak::extraction {

namespace {

bool isWordChar(unsigned char c) {
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences and stay inside the word
    return std::isalnum(c) != 0 || c == '_' || c == '-' || c == '\'' || c >= 0x80;
}

float clamp01(float v) {
    if (v < 0.0f)
        return 0.0f;
    if (v > 1.0f)
        return 1.0f;
    return v;
}

bool wantsLabel(const std::vector<std::string>& labels, const std::string& label) {
    return labels.empty() || std::find(labels.begin(), labels.end(), label) != labels.end();
}

} // namespace

std::string GazetteerLabeler::normalize(std::string_view s) const {
    auto l = s.begin();
    auto r = s.end();
    while (l < r && !std::isalnum(static_cast<unsigned char>(*l)) &&
           static_cast<unsigned char>(*l) < 0x80)
        ++l;
    while (r > l && !std::isalnum(static_cast<unsigned char>(*(r - 1))) &&
           static_cast<unsigned char>(*(r - 1)) < 0x80)
        --r;
    std::string out(l, r);
    return config_.case_insensitive ? toLower(out) : out;
}

std::vector<GazetteerLabeler::Token> GazetteerLabeler::tokenize(std::string_view text) const {
    std::vector<Token> tokens;
    tokens.reserve(text.size() / 5 + 1);
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isWordChar(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i >= text.size())
            break;
        const std::size_t start = i;
        while (i < text.size() && isWordChar(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        auto norm = normalize(text.substr(start, i - start));
        if (!norm.empty()) {
            tokens.push_back({std::move(norm), start, i});
        }
    }
    return tokens;
}

Result<void> GazetteerLabeler::addAlias(const AliasEntry& entry) {
    if (entry.alias.empty() || entry.label.empty()) {
        return Error{ErrorCode::InvalidArgument, "alias and label must be non-empty"};
    }
    if (entry.score < 0.0f || entry.score > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "score must be within [0,1]"};
    }

    std::string key;
    for (const auto& tok : tokenize(entry.alias)) {
        if (!key.empty())
            key.push_back(' ');
        key.append(tok.norm);
    }
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "alias has no word characters: " + entry.alias};
    }

    std::unique_lock lock(mutex_);
    alias_map_[key].emplace_back(toLower(trimCopy(entry.label)), clamp01(entry.score));
    return {};
}

Result<void> GazetteerLabeler::addAliases(const std::vector<AliasEntry>& entries) {
    for (const auto& e : entries) {
        auto r = addAlias(e);
        if (!r) {
            return r;
        }
    }
    return {};
}

Result<void> GazetteerLabeler::addPattern(const PatternEntry& entry) {
    if (entry.label.empty() || entry.regex.empty()) {
        return Error{ErrorCode::InvalidArgument, "pattern label and regex must be non-empty"};
    }
    if (entry.score < 0.0f || entry.score > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "score must be within [0,1]"};
    }

    try {
        CompiledPattern p{toLower(trimCopy(entry.label)), entry.regex,
                          std::regex(entry.regex, std::regex::ECMAScript), entry.score};
        std::unique_lock lock(mutex_);
        patterns_.push_back(std::move(p));
    } catch (const std::regex_error& e) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid pattern '" + entry.regex + "': " + e.what()};
    }
    return {};
}

Result<void> GazetteerLabeler::addDefaultPatterns() {
    static const std::vector<PatternEntry> defaults{
        {"email", R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", 0.95f},
        {"phone", R"((\(\d{3}\)\s?|\b\d{3}[-.])\d{3}[-.]\d{4}\b)", 0.85f},
        {"date", R"(\b\d{1,2}/\d{1,2}/\d{4}\b)", 0.9f},
        {"date", R"(\b\d{4}-\d{1,2}-\d{1,2}\b)", 0.9f},
        {"date", R"(\b\d{1,2}-\d{1,2}-\d{4}\b)", 0.9f},
    };
    for (const auto& p : defaults) {
        auto r = addPattern(p);
        if (!r) {
            return r;
        }
    }
    return {};
}

Result<void> GazetteerLabeler::loadFromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "gazetteer document must be a JSON object"};
    }

    try {
        if (doc.contains("aliases")) {
            for (const auto& a : doc.at("aliases")) {
                AliasEntry entry{a.at("alias").get<std::string>(),
                                 a.at("label").get<std::string>(), a.value("score", 0.9f)};
                auto r = addAlias(entry);
                if (!r) {
                    return r;
                }
            }
        }
        if (doc.contains("patterns")) {
            for (const auto& p : doc.at("patterns")) {
                PatternEntry entry{p.at("label").get<std::string>(),
                                   p.at("regex").get<std::string>(), p.value("score", 0.8f)};
                auto r = addPattern(entry);
                if (!r) {
                    return r;
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed gazetteer: ") + e.what()};
    }

    spdlog::info("Gazetteer loaded: {} aliases, {} patterns", aliasCount(), patternCount());
    return {};
}

Result<void> GazetteerLabeler::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "cannot open gazetteer file: " + path.string()};
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, "gazetteer file is not valid JSON: " + path.string()};
    }
    return loadFromJson(doc);
}

void GazetteerLabeler::clear() {
    std::unique_lock lock(mutex_);
    alias_map_.clear();
    patterns_.clear();
}

std::size_t GazetteerLabeler::aliasCount() const {
    std::shared_lock lock(mutex_);
    std::size_t n = 0;
    for (const auto& [_, v] : alias_map_) {
        n += v.size();
    }
    return n;
}

std::size_t GazetteerLabeler::patternCount() const {
    std::shared_lock lock(mutex_);
    return patterns_.size();
}

std::optional<GazetteerLabeler::LabelPrior>
GazetteerLabeler::lookupBest(const std::string& norm, const std::vector<std::string>& labels) const {
    auto it = alias_map_.find(norm);
    if (it == alias_map_.end()) {
        return std::nullopt;
    }
    std::optional<LabelPrior> best;
    for (const auto& candidate : it->second) {
        if (!wantsLabel(labels, candidate.first))
            continue;
        if (!best || candidate.second > best->second) {
            best = candidate;
        }
    }
    return best;
}

Result<SpanList> GazetteerLabeler::label(std::string_view text,
                                         const std::vector<std::string>& labels,
                                         float threshold) const {
    if (!config_.is_valid()) {
        return Error{ErrorCode::InvalidArgument, "Invalid GazetteerConfig"};
    }

    std::vector<std::string> wanted;
    wanted.reserve(labels.size());
    for (const auto& l : labels) {
        wanted.push_back(toLower(trimCopy(l)));
    }

    SpanList out;
    const auto tokens = tokenize(text);

    std::shared_lock lock(mutex_);

    // Longest-first matching to avoid overlapping shorter phrases
    std::vector<bool> used(tokens.size(), false);
    for (std::size_t n = std::min(config_.max_ngram, tokens.size()); n >= 1; --n) {
        for (std::size_t i = 0; i + n <= tokens.size(); ++i) {
            if (std::any_of(used.begin() + static_cast<std::ptrdiff_t>(i),
                            used.begin() + static_cast<std::ptrdiff_t>(i + n),
                            [](bool u) { return u; }))
                continue;

            std::string phrase;
            for (std::size_t j = 0; j < n; ++j) {
                if (j)
                    phrase.push_back(' ');
                phrase.append(tokens[i + j].norm);
            }

            auto match = lookupBest(phrase, wanted);
            if (!match || match->second < threshold) {
                continue;
            }

            Span span;
            span.label = match->first;
            span.start = tokens[i].start;
            span.end = tokens[i + n - 1].end;
            span.text = std::string(text.substr(span.start, span.end - span.start));
            span.score = match->second;
            out.push_back(std::move(span));

            std::fill(used.begin() + static_cast<std::ptrdiff_t>(i),
                      used.begin() + static_cast<std::ptrdiff_t>(i + n), true);
        }
        if (n == 1)
            break;
    }

    if (!patterns_.empty()) {
        const std::string haystack(text);
        for (const auto& p : patterns_) {
            if (p.score < threshold || !wantsLabel(wanted, p.label))
                continue;
            for (auto it = std::sregex_iterator(haystack.begin(), haystack.end(), p.regex);
                 it != std::sregex_iterator(); ++it) {
                const auto& m = *it;
                if (m.length(0) == 0)
                    continue;
                Span span;
                span.label = p.label;
                span.start = static_cast<std::size_t>(m.position(0));
                span.end = span.start + static_cast<std::size_t>(m.length(0));
                span.text = m.str(0);
                span.score = p.score;
                out.push_back(std::move(span));
            }
        }
    }

    sortByStart(out);
    return out;
}

nlohmann::json GazetteerLabeler::info() const {
    return nlohmann::json{{"name", name()},
                          {"aliases", aliasCount()},
                          {"patterns", patternCount()},
                          {"max_ngram", config_.max_ngram}};
}

} // namespace cloak::extraction
