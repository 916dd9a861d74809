#include <cloak/extraction/multi_pass_extractor.h>

#include <spdlog/spdlog.h>

#include <set>
#include <stdexcept>
#include <utility>

namespace cloak::extraction {

std::vector<std::string> prepareLabels(const std::vector<std::string>& labels) {
    const auto& source = labels.empty() ? defaultLabels() : labels;
    std::vector<std::string> out;
    out.reserve(source.size());
    for (const auto& l : source) {
        out.push_back(toLower(l));
    }
    return out;
}

MultiPassExtractor::MultiPassExtractor(std::shared_ptr<const ILabeler> labeler,
                                       MultiPassConfig config)
    : labeler_(std::move(labeler)), config_(config) {
    if (!labeler_) {
        throw std::invalid_argument("MultiPassExtractor requires a labeler");
    }
}

ExtractionOutcome MultiPassExtractor::extract(std::string_view text,
                                              const std::vector<std::string>& labels) const {
    return extract(text, labels, config_.maxPasses);
}

ExtractionOutcome MultiPassExtractor::extract(std::string_view text,
                                              const std::vector<std::string>& labels,
                                              std::size_t maxPasses) const {
    ExtractionOutcome outcome;
    if (text.empty() || isBlank(text)) {
        spdlog::warn("Empty or blank input text provided to multi-pass extractor");
        return outcome;
    }

    const auto processed = prepareLabels(labels);
    spdlog::debug("Starting multi-pass extraction with {} passes over {} labels", maxPasses,
                  processed.size());

    std::set<std::pair<std::size_t, std::size_t>> seen;
    std::string working(text);

    for (std::size_t pass = 0; pass < maxPasses; ++pass) {
        const float threshold = thresholdForPass(pass);

        Result<SpanList> found = Error{ErrorCode::Unknown};
        try {
            found = labeler_->label(working, processed, threshold);
        } catch (const std::exception& e) {
            found = Error{ErrorCode::InternalError, e.what()};
        }
        if (!found) {
            spdlog::warn("Labeler failed in pass {}: {}", pass + 1, found.error().message);
            ++outcome.labelerErrors;
            break;
        }
        ++outcome.passesCompleted;

        SpanList fresh;
        for (auto& span : found.value()) {
            if (span.start >= span.end || span.end > text.size()) {
                spdlog::debug("Dropping out-of-range span [{}, {})", span.start, span.end);
                continue;
            }
            if (!seen.emplace(span.start, span.end).second) {
                continue;
            }
            span.text = std::string(text.substr(span.start, span.end - span.start));
            fresh.push_back(std::move(span));
        }

        spdlog::debug("Pass {}: {} candidates, {} new (threshold {})", pass + 1,
                      found.value().size(), fresh.size(), threshold);

        if (fresh.empty()) {
            spdlog::debug("No new entities in pass {}, stopping early", pass + 1);
            break;
        }

        for (const auto& span : fresh) {
            working.replace(span.start, span.end - span.start, span.end - span.start, ' ');
        }

        outcome.spans.insert(outcome.spans.end(), std::make_move_iterator(fresh.begin()),
                             std::make_move_iterator(fresh.end()));
    }

    sortByStart(outcome.spans);
    spdlog::info("Multi-pass extraction found {} entities in {} passes", outcome.spans.size(),
                 outcome.passesCompleted);
    return outcome;
}

} // namespace cloak::extraction
