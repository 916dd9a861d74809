#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cloak {

/**
 * @brief A labeled, scored byte range [start, end) within a source text.
 */
struct Span {
    std::string label;
    std::string text;
    std::size_t start = 0;
    std::size_t end = 0;
    float score = 0.0f;

    std::size_t length() const { return end > start ? end - start : 0; }

    bool overlaps(const Span& other) const {
        return !(end <= other.start || other.end <= start);
    }

    bool operator==(const Span&) const = default;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{
            {"label", label}, {"text", text}, {"start", start}, {"end", end}, {"score", score}};
    }

    static Span fromJson(const nlohmann::json& j);
};

using SpanList = std::vector<Span>;

// Default labels used when a caller supplies none
inline const std::vector<std::string>& defaultLabels() {
    static const std::vector<std::string> labels{"person", "date", "location", "organization"};
    return labels;
}

// Stable sort by start offset; equal starts keep input order
void sortByStart(SpanList& spans);

nlohmann::json toJson(const SpanList& spans);

// Serialize for output; bytes that are not valid UTF-8 become U+FFFD instead of throwing
std::string dumpJson(const nlohmann::json& j, int indent = -1);

// Text helpers shared by the pipeline stages
std::string toLower(std::string_view s);
std::string toUpper(std::string_view s);
std::string trimCopy(std::string_view s);
// Collapse whitespace runs to a single space and trim both ends
std::string normalizeWhitespace(std::string_view s);
std::size_t countWords(std::string_view text);
bool isBlank(std::string_view text);

} // namespace cloak
