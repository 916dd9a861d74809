#pragma once

#include <cloak/anonymization/replacement_strategy.h>
#include <cloak/anonymization/synthetic_generator.h>

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace cloak::anonymization {

enum class DateFormat { MonthDayYearSlash, MonthDayYearDash, IsoDate, DayMonthNameYear,
                        MonthNameDayYear, YearOnly };

/**
 * Replaces dates with a different date written in the same format. Uses the synthetic
 * generator's date facility when one is available, otherwise draws from 1990-2023
 * with days 1-28.
 */
class DateStrategy final : public IReplacementStrategy {
public:
    DateStrategy(RandomEngine& rng, std::shared_ptr<ISyntheticGenerator> generator);

    StrategyKind kind() const override { return StrategyKind::Date; }
    bool canHandle(std::string_view label) const override;
    std::optional<std::string> generate(const Span& span) override;

    // First matching format, tried in a fixed order anchored at the start of the text
    std::optional<DateFormat> detectFormat(std::string_view text) const;

    static std::string formatDate(const Date& date, DateFormat format);
    static bool isBirthdayLabel(std::string_view label);

private:
    Date randomDate();
    Date randomDateBetween(const Date& from, const Date& to);

    RandomEngine& rng_;
    std::shared_ptr<ISyntheticGenerator> generator_;
    std::vector<std::pair<std::regex, DateFormat>> patterns_;
};

} // namespace cloak::anonymization
