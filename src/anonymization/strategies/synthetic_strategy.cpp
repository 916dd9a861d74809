#include <cloak/anonymization/strategies/synthetic_strategy.h>

#include <spdlog/spdlog.h>

namespace cloak::anonymization {

std::optional<SyntheticCategory> SyntheticStrategy::categoryFor(std::string_view label) {
    if (label == "person" || label == "name")
        return SyntheticCategory::Name;
    if (label == "first_name")
        return SyntheticCategory::FirstName;
    if (label == "last_name")
        return SyntheticCategory::LastName;
    if (label == "email")
        return SyntheticCategory::Email;
    if (label == "phone")
        return SyntheticCategory::Phone;
    if (label == "address")
        return SyntheticCategory::Address;
    if (label == "company" || label == "organization")
        return SyntheticCategory::Company;
    if (label == "city")
        return SyntheticCategory::City;
    if (label == "state")
        return SyntheticCategory::State;
    if (label == "job" || label == "profession")
        return SyntheticCategory::Job;
    if (label == "age")
        return SyntheticCategory::Age;
    return std::nullopt;
}

bool SyntheticStrategy::canHandle(std::string_view label) const {
    return generator_ != nullptr && categoryFor(label).has_value();
}

std::optional<std::string> SyntheticStrategy::generate(const Span& span) {
    if (!generator_) {
        return std::nullopt;
    }
    const auto category = categoryFor(toLower(span.label));
    if (!category) {
        return std::nullopt;
    }

    std::optional<std::string> value = generator_->generate(*category);
    for (int attempt = 0; attempt < kMaxAttempts && value && *value == span.text; ++attempt) {
        value = generator_->generate(*category);
    }
    if (!value) {
        spdlog::debug("Synthetic generator has no value for category '{}'",
                      syntheticCategoryName(*category));
    }
    return value;
}

} // namespace cloak::anonymization
