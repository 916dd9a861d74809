#pragma once

#include <cloak/anonymization/replacement_strategy.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cloak::anonymization {

/**
 * Swaps country-like text for a different country. Generic locations become any
 * country, nationalities become the demonym of a random country.
 */
class CountryStrategy final : public IReplacementStrategy {
public:
    explicit CountryStrategy(RandomEngine& rng);

    StrategyKind kind() const override { return StrategyKind::Country; }
    bool canHandle(std::string_view label) const override;
    std::optional<std::string> generate(const Span& span) override;

    // {"countries": ["...", ...]}; an empty or missing array keeps the current list
    Result<void> loadFromFile(const std::filesystem::path& path);

    bool isCountryLike(std::string_view text) const;
    static std::string toNationality(const std::string& country);
    static const std::vector<std::string>& builtinCountries();

    const std::vector<std::string>& countries() const { return countries_; }

private:
    const std::string& pickCountry();

    RandomEngine& rng_;
    std::vector<std::string> countries_;
};

} // namespace cloak::anonymization
