#include <cloak/anonymization/strategies/date_strategy.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>

namespace cloak::anonymization {

namespace {

constexpr std::array<std::string_view, 12> kMonths = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

constexpr int kFallbackFirstYear = 1990;
constexpr int kFallbackLastYear = 2023;

} // namespace

DateStrategy::DateStrategy(RandomEngine& rng, std::shared_ptr<ISyntheticGenerator> generator)
    : rng_(rng), generator_(std::move(generator)) {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    patterns_.emplace_back(std::regex(R"(^\d{1,2}/\d{1,2}/\d{4}\b)", flags),
                           DateFormat::MonthDayYearSlash);
    patterns_.emplace_back(std::regex(R"(^\d{1,2}-\d{1,2}-\d{4}\b)", flags),
                           DateFormat::MonthDayYearDash);
    patterns_.emplace_back(std::regex(R"(^\d{4}-\d{1,2}-\d{1,2}\b)", flags), DateFormat::IsoDate);
    patterns_.emplace_back(std::regex(R"(^\d{1,2}\s+\w+\s+\d{4}\b)", flags),
                           DateFormat::DayMonthNameYear);
    patterns_.emplace_back(std::regex(R"(^\w+\s+\d{1,2},?\s+\d{4}\b)", flags),
                           DateFormat::MonthNameDayYear);
    patterns_.emplace_back(std::regex(R"(^\d{4}\b)", flags), DateFormat::YearOnly);
}

bool DateStrategy::canHandle(std::string_view label) const {
    return label == "date" || label == "time" || label == "datetime" || label == "day" ||
           label == "month" || label == "year" || isBirthdayLabel(label);
}

bool DateStrategy::isBirthdayLabel(std::string_view label) {
    return label == "birthday" || label == "dob" || label == "date_of_birth";
}

std::optional<DateFormat> DateStrategy::detectFormat(std::string_view text) const {
    const std::string s(text);
    for (const auto& [re, format] : patterns_) {
        if (std::regex_search(s, re)) {
            return format;
        }
    }
    return std::nullopt;
}

std::string DateStrategy::formatDate(const Date& date, DateFormat format) {
    const int y = static_cast<int>(date.year());
    const unsigned m = static_cast<unsigned>(date.month());
    const unsigned d = static_cast<unsigned>(date.day());
    const auto monthName = kMonths[(m >= 1 && m <= 12 ? m : 1) - 1];

    switch (format) {
        case DateFormat::MonthDayYearSlash: return fmt::format("{:02d}/{:02d}/{}", m, d, y);
        case DateFormat::MonthDayYearDash: return fmt::format("{:02d}-{:02d}-{}", m, d, y);
        case DateFormat::IsoDate: return fmt::format("{}-{:02d}-{:02d}", y, m, d);
        case DateFormat::DayMonthNameYear: return fmt::format("{} {} {}", d, monthName, y);
        case DateFormat::MonthNameDayYear: return fmt::format("{} {}, {}", monthName, d, y);
        case DateFormat::YearOnly: return std::to_string(y);
    }
    return fmt::format("{}-{:02d}-{:02d}", y, m, d);
}

Date DateStrategy::randomDateBetween(const Date& from, const Date& to) {
    if (generator_) {
        if (auto d = generator_->date(from, to)) {
            return *d;
        }
    }
    const auto lo = std::chrono::sys_days{from}.time_since_epoch().count();
    const auto hi = std::chrono::sys_days{to}.time_since_epoch().count();
    std::uniform_int_distribution<long long> dist(std::min(lo, hi), std::max(lo, hi));
    return Date{std::chrono::sys_days{std::chrono::days{dist(rng_)}}};
}

Date DateStrategy::randomDate() {
    if (generator_) {
        const auto now = today();
        if (auto d = generator_->date(addYears(now, -30), now)) {
            return *d;
        }
    }
    std::uniform_int_distribution<int> year(kFallbackFirstYear, kFallbackLastYear);
    std::uniform_int_distribution<unsigned> month(1, 12);
    std::uniform_int_distribution<unsigned> day(1, 28);
    return Date{std::chrono::year{year(rng_)}, std::chrono::month{month(rng_)},
                std::chrono::day{day(rng_)}};
}

std::optional<std::string> DateStrategy::generate(const Span& span) {
    const auto original = trimCopy(span.text);
    const auto label = toLower(span.label);

    if (auto format = detectFormat(original)) {
        return formatDate(randomDate(), *format);
    }

    const auto now = today();
    if (isBirthdayLabel(label)) {
        return formatDate(randomDateBetween(addYears(now, -80), addYears(now, -18)),
                          DateFormat::IsoDate);
    }
    return formatDate(randomDateBetween(addYears(now, -10), now), DateFormat::IsoDate);
}

} // namespace cloak::anonymization
