#include <cloak/anonymization/strategies/country_strategy.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <unordered_map>

namespace cloak::anonymization {

namespace {

constexpr std::array<std::string_view, 9> kCountryIndicators = {
    "united states", "usa", "uk", "united kingdom", "china", "india", "brazil", "russia", "japan"};

} // namespace

const std::vector<std::string>& CountryStrategy::builtinCountries() {
    static const std::vector<std::string> countries{
        "United States", "Canada",      "United Kingdom", "Germany",     "France",
        "Italy",         "Spain",       "Netherlands",    "Belgium",     "Switzerland",
        "Austria",       "Sweden",      "Norway",         "Denmark",     "Finland",
        "Australia",     "New Zealand", "Japan",          "South Korea", "Singapore",
        "Brazil",        "Argentina",   "Mexico",         "Chile",       "Colombia",
        "India",         "China",       "Thailand",       "Vietnam",     "Philippines",
        "South Africa",  "Egypt",       "Morocco",        "Kenya",       "Ghana",
        "Russia",        "Poland",      "Czech Republic", "Hungary",     "Romania"};
    return countries;
}

CountryStrategy::CountryStrategy(RandomEngine& rng) : rng_(rng), countries_(builtinCountries()) {}

bool CountryStrategy::canHandle(std::string_view label) const {
    return label == "country" || label == "location" || label == "nationality" ||
           label == "place";
}

Result<void> CountryStrategy::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "cannot open countries file: " + path.string()};
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::InvalidData, "countries file is not a JSON object: " + path.string()};
    }

    std::vector<std::string> loaded;
    if (auto it = doc.find("countries"); it != doc.end() && it->is_array()) {
        for (const auto& c : *it) {
            if (c.is_string() && !c.get<std::string>().empty()) {
                loaded.push_back(c.get<std::string>());
            }
        }
    }
    if (loaded.empty()) {
        spdlog::warn("Countries file {} has no entries, keeping built-in list", path.string());
        return {};
    }

    countries_ = std::move(loaded);
    spdlog::debug("Loaded {} countries from {}", countries_.size(), path.string());
    return {};
}

bool CountryStrategy::isCountryLike(std::string_view text) const {
    const auto lower = toLower(text);
    for (const auto& c : countries_) {
        if (toLower(c) == lower) {
            return true;
        }
    }
    for (auto indicator : kCountryIndicators) {
        if (lower.find(indicator) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string CountryStrategy::toNationality(const std::string& country) {
    static const std::unordered_map<std::string, std::string> demonyms{
        {"United States", "American"}, {"United Kingdom", "British"}, {"Germany", "German"},
        {"France", "French"},          {"Italy", "Italian"},          {"Spain", "Spanish"},
        {"Canada", "Canadian"},        {"Australia", "Australian"},   {"Japan", "Japanese"},
        {"China", "Chinese"},          {"India", "Indian"},           {"Brazil", "Brazilian"}};
    if (auto it = demonyms.find(country); it != demonyms.end()) {
        return it->second;
    }
    return country + "n";
}

const std::string& CountryStrategy::pickCountry() {
    std::uniform_int_distribution<std::size_t> dist(0, countries_.size() - 1);
    return countries_[dist(rng_)];
}

std::optional<std::string> CountryStrategy::generate(const Span& span) {
    const auto original = trimCopy(span.text);
    const auto label = toLower(span.label);

    if (isCountryLike(original)) {
        const auto lower = toLower(original);
        std::vector<const std::string*> others;
        for (const auto& c : countries_) {
            if (toLower(c) != lower) {
                others.push_back(&c);
            }
        }
        if (others.empty()) {
            return std::nullopt;
        }
        std::uniform_int_distribution<std::size_t> dist(0, others.size() - 1);
        return *others[dist(rng_)];
    }
    if (label == "location") {
        return pickCountry();
    }
    if (label == "nationality") {
        return toNationality(pickCountry());
    }
    return std::nullopt;
}

} // namespace cloak::anonymization
