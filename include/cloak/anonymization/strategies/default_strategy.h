#pragma once

#include <cloak/anonymization/replacement_strategy.h>

#include <optional>
#include <string>

namespace cloak::anonymization {

/**
 * Last-resort strategy; handles every label and always produces a value.
 *
 * A few labels (email, phone, ssn, id, number, code, username) get a generated value
 * of that shape. Everything else keeps its character classes: each digit becomes a
 * random digit, each ASCII letter a random letter of the same case, other bytes stay.
 * Text without any alphanumeric character becomes "[LABEL_REDACTED]".
 */
class DefaultStrategy final : public IReplacementStrategy {
public:
    explicit DefaultStrategy(RandomEngine& rng) : rng_(rng) {}

    StrategyKind kind() const override { return StrategyKind::Default; }
    bool canHandle(std::string_view) const override { return true; }
    std::optional<std::string> generate(const Span& span) override;

    // Never empty
    std::string replacementFor(const Span& span);

private:
    std::string preserveShape(const std::string& original, const std::string& label);
    std::string randomChars(std::string_view alphabet, std::size_t n);
    int uniform(int lo, int hi);

    RandomEngine& rng_;
};

} // namespace cloak::anonymization
