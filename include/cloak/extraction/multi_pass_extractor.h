#pragma once

#include <cloak/entity/span.h>
#include <cloak/extraction/labeler.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cloak::extraction {

struct MultiPassConfig {
    std::size_t maxPasses = 2;
    float firstPassThreshold = 0.5f; // Precise spans first
    float laterPassThreshold = 0.3f; // Recover weaker matches in the unmasked remainder
};

struct ExtractionOutcome {
    SpanList spans;
    std::size_t passesCompleted = 0; // Passes in which the labeler ran
    std::size_t labelerErrors = 0;
};

/**
 * @brief Single-threaded iterative masking extractor.
 *
 * Each pass runs the labeler over a working copy of the text in which every span found
 * by earlier passes has been blanked out with spaces of identical length, so offsets in
 * the working copy always equal offsets in the original.
 */
class MultiPassExtractor {
public:
    explicit MultiPassExtractor(std::shared_ptr<const ILabeler> labeler,
                                MultiPassConfig config = {});

    ExtractionOutcome extract(std::string_view text, const std::vector<std::string>& labels) const;
    ExtractionOutcome extract(std::string_view text, const std::vector<std::string>& labels,
                              std::size_t maxPasses) const;

    const MultiPassConfig& getConfig() const { return config_; }
    const ILabeler& labeler() const { return *labeler_; }

    float thresholdForPass(std::size_t pass) const {
        return pass == 0 ? config_.firstPassThreshold : config_.laterPassThreshold;
    }

private:
    std::shared_ptr<const ILabeler> labeler_;
    MultiPassConfig config_;
};

// Lower-cases labels and substitutes the default set for an empty list
std::vector<std::string> prepareLabels(const std::vector<std::string>& labels);

} // namespace cloak::extraction
