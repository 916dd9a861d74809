#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace cloak::anonymization {

enum class SyntheticCategory {
    Name,
    FirstName,
    LastName,
    Email,
    Phone,
    Address,
    Company,
    City,
    State,
    Job,
    Age
};

const char* syntheticCategoryName(SyntheticCategory category);

using Date = std::chrono::year_month_day;

// Current UTC calendar date
Date today();

// Shift by whole years, clamping Feb 29 to Feb 28 where needed
Date addYears(const Date& date, int years);

/**
 * @brief Locale-aware source of realistic fake values.
 *
 * Returns std::nullopt when a category is not supported by the implementation.
 */
class ISyntheticGenerator {
public:
    virtual ~ISyntheticGenerator() = default;

    virtual std::optional<std::string> generate(SyntheticCategory category) = 0;

    // Uniformly distributed date in [from, to]; nullopt when the range is empty
    virtual std::optional<Date> date(const Date& from, const Date& to) = 0;

    virtual std::string locale() const = 0;

    virtual void seed(std::uint64_t value) { (void)value; }
};

/**
 * Built-in generator backed by small word tables. Only en_US tables exist; other
 * locales fall back to them with a warning.
 */
class BasicSyntheticGenerator final : public ISyntheticGenerator {
public:
    explicit BasicSyntheticGenerator(std::string locale = "en_US",
                                     std::optional<std::uint64_t> seed = std::nullopt);

    std::optional<std::string> generate(SyntheticCategory category) override;
    std::optional<Date> date(const Date& from, const Date& to) override;
    std::string locale() const override { return locale_; }
    void seed(std::uint64_t value) override { rng_.seed(value); }

private:
    std::string_view pick(const std::string_view* table, std::size_t size);
    int uniform(int lo, int hi);

    std::string firstName();
    std::string lastName();
    std::string email();
    std::string phone();
    std::string address();
    std::string company();

    std::string locale_;
    std::mt19937_64 rng_;
};

} // namespace cloak::anonymization
