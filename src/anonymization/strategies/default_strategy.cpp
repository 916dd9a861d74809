#include <cloak/anonymization/strategies/default_strategy.h>

#include <spdlog/fmt/fmt.h>

#include <array>

namespace cloak::anonymization {

namespace {

constexpr std::string_view kDigits = "0123456789";
constexpr std::string_view kLower = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kUpperAndDigits = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr std::array<std::string_view, 4> kDomains = {"example.com", "test.org", "sample.net",
                                                      "demo.co"};
constexpr std::array<std::string_view, 4> kUserPrefixes = {"user", "demo", "test", "sample"};

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}
bool isAsciiUpper(char c) {
    return c >= 'A' && c <= 'Z';
}
bool isAsciiLower(char c) {
    return c >= 'a' && c <= 'z';
}

} // namespace

int DefaultStrategy::uniform(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

std::string DefaultStrategy::randomChars(std::string_view alphabet, std::size_t n) {
    std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);
    std::string out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(alphabet[dist(rng_)]);
    }
    return out;
}

std::string DefaultStrategy::preserveShape(const std::string& original, const std::string& label) {
    bool hasAlnum = false;
    std::string out;
    out.reserve(original.size());
    for (char c : original) {
        if (isAsciiDigit(c)) {
            out += randomChars(kDigits, 1);
            hasAlnum = true;
        } else if (isAsciiUpper(c)) {
            out += randomChars(kUpper, 1);
            hasAlnum = true;
        } else if (isAsciiLower(c)) {
            out += randomChars(kLower, 1);
            hasAlnum = true;
        } else {
            out.push_back(c);
        }
    }
    if (!hasAlnum) {
        return "[" + toUpper(label) + "_REDACTED]";
    }
    return out;
}

std::string DefaultStrategy::replacementFor(const Span& span) {
    const auto label = toLower(span.label);

    if (label == "email") {
        const auto user = randomChars(kLower, static_cast<std::size_t>(uniform(5, 10)));
        const auto domain = kDomains[static_cast<std::size_t>(uniform(0, 3))];
        return fmt::format("{}@{}", user, domain);
    }
    if (label == "phone") {
        return fmt::format("({}) {}-{}", uniform(200, 999), uniform(200, 999), uniform(1000, 9999));
    }
    if (label == "ssn") {
        return fmt::format("{}-{}-{}", uniform(100, 999), uniform(10, 99), uniform(1000, 9999));
    }
    if (label == "id") {
        return randomChars(kUpper, 2) + randomChars(kDigits, 6);
    }
    if (label == "number") {
        return std::to_string(uniform(100000, 999999));
    }
    if (label == "code") {
        return randomChars(kUpperAndDigits, 8);
    }
    if (label == "username") {
        const auto prefix = kUserPrefixes[static_cast<std::size_t>(uniform(0, 3))];
        return fmt::format("{}{}", prefix, uniform(100, 9999));
    }
    return preserveShape(span.text, label.empty() ? std::string("entity") : label);
}

std::optional<std::string> DefaultStrategy::generate(const Span& span) {
    return replacementFor(span);
}

} // namespace cloak::anonymization
