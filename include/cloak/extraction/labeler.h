#pragma once

#include <cloak/core/types.h>
#include <cloak/entity/span.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cloak::extraction {

/**
 * @brief Entity labeling capability (the model).
 *
 * Given a text, a label set and a confidence threshold, returns candidate spans with
 * 0 <= start < end <= text.size(). Offsets are relative to the text passed in.
 * Implementations must be safe to call concurrently and keep no state across calls.
 */
class ILabeler {
public:
    virtual ~ILabeler() = default;

    virtual Result<SpanList> label(std::string_view text, const std::vector<std::string>& labels,
                                   float threshold) const = 0;

    virtual std::string name() const = 0;

    virtual nlohmann::json info() const { return nlohmann::json{{"name", name()}}; }
};

} // namespace cloak::extraction
