#include <cloak/anonymization/replacement_strategy.h>

namespace cloak::anonymization {

Result<StrategyKind> parseStrategyKind(std::string_view name) {
    const auto key = toLower(trimCopy(name));
    if (key == "synthetic")
        return StrategyKind::Synthetic;
    if (key == "country")
        return StrategyKind::Country;
    if (key == "date")
        return StrategyKind::Date;
    if (key == "default")
        return StrategyKind::Default;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown replacement strategy '" + std::string(name) +
                     "' (expected synthetic, country, date or default)"};
}

} // namespace cloak::anonymization
