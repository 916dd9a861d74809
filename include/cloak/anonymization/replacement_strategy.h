#pragma once

#include <cloak/core/types.h>
#include <cloak/entity/span.h>

#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace cloak::anonymization {

using RandomEngine = std::mt19937_64;

// The closed set of replacement strategies
enum class StrategyKind { Synthetic, Country, Date, Default };

constexpr const char* strategyName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Synthetic: return "synthetic";
        case StrategyKind::Country: return "country";
        case StrategyKind::Date: return "date";
        case StrategyKind::Default: return "default";
    }
    return "default";
}

Result<StrategyKind> parseStrategyKind(std::string_view name);

/**
 * @brief One way of producing a replacement value for a span.
 *
 * generate() returns std::nullopt when the strategy has nothing usable for this span;
 * the replacer then moves on to the next strategy in the label's chain.
 */
class IReplacementStrategy {
public:
    virtual ~IReplacementStrategy() = default;

    virtual StrategyKind kind() const = 0;
    std::string name() const { return strategyName(kind()); }

    // Label is expected lower-cased
    virtual bool canHandle(std::string_view label) const = 0;

    virtual std::optional<std::string> generate(const Span& span) = 0;
};

} // namespace cloak::anonymization
