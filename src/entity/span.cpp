#include <cloak/entity/span.h>

#include <algorithm>
#include <cctype>

namespace cloak {

Span Span::fromJson(const nlohmann::json& j) {
    Span span;
    span.label = j.value("label", std::string{});
    span.text = j.value("text", std::string{});
    span.start = j.value("start", std::size_t{0});
    span.end = j.value("end", std::size_t{0});
    span.score = j.value("score", 1.0f);
    return span;
}

void sortByStart(SpanList& spans) {
    std::stable_sort(spans.begin(), spans.end(),
                     [](const Span& a, const Span& b) { return a.start < b.start; });
}

nlohmann::json toJson(const SpanList& spans) {
    auto arr = nlohmann::json::array();
    for (const auto& span : spans) {
        arr.push_back(span.toJson());
    }
    return arr;
}

std::string dumpJson(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string trimCopy(std::string_view s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && isSpace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::string normalizeWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::size_t countWords(std::string_view text) {
    std::size_t words = 0;
    bool inWord = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace cloak
