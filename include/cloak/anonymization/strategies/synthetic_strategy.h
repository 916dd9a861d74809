#pragma once

#include <cloak/anonymization/replacement_strategy.h>
#include <cloak/anonymization/synthetic_generator.h>

#include <memory>
#include <optional>

namespace cloak::anonymization {

/**
 * Delegates to an ISyntheticGenerator by semantic category. Without a generator the
 * strategy handles nothing.
 */
class SyntheticStrategy final : public IReplacementStrategy {
public:
    static constexpr int kMaxAttempts = 3;

    explicit SyntheticStrategy(std::shared_ptr<ISyntheticGenerator> generator)
        : generator_(std::move(generator)) {}

    StrategyKind kind() const override { return StrategyKind::Synthetic; }
    bool canHandle(std::string_view label) const override;
    std::optional<std::string> generate(const Span& span) override;

    static std::optional<SyntheticCategory> categoryFor(std::string_view label);

private:
    std::shared_ptr<ISyntheticGenerator> generator_;
};

} // namespace cloak::anonymization
