#include <cloak/extraction/multi_pass_extractor.h>
#include <cloak/extraction/parallel_dispatcher.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <memory>

namespace cloak::extraction {

ParallelDispatcher::ParallelDispatcher(DispatchConfig config) : config_(config) {
    if (config_.workerCount == 0) {
        config_.workerCount = 1;
    }
}

bool ParallelDispatcher::shouldDispatch(std::string_view text, std::size_t maxWordsPerChunk) {
    return countWords(text) > maxWordsPerChunk;
}

ChunkOutcome ParallelDispatcher::labelChunk(const chunking::TextChunk& chunk, std::size_t index,
                                            const ILabeler& labeler,
                                            const std::vector<std::string>& labels,
                                            float threshold) {
    ChunkOutcome outcome;
    outcome.index = index;
    outcome.offset = chunk.offset;

    Result<SpanList> found = Error{ErrorCode::Unknown};
    try {
        found = labeler.label(chunk.text, labels, threshold);
    } catch (const std::exception& e) {
        outcome.error = e.what();
        return outcome;
    }
    if (!found) {
        outcome.error = found.error().message;
        return outcome;
    }

    for (auto& span : found.value()) {
        if (span.start >= span.end || span.end > chunk.text.size()) {
            spdlog::debug("Chunk {}: dropping out-of-range span [{}, {})", index, span.start,
                          span.end);
            continue;
        }
        span.text = chunk.text.substr(span.start, span.end - span.start);
        span.start += chunk.offset;
        span.end += chunk.offset;
        outcome.spans.push_back(std::move(span));
    }
    outcome.success = true;
    return outcome;
}

DispatchResult ParallelDispatcher::dispatch(std::string_view text, const ILabeler& labeler,
                                            const std::vector<std::string>& labels) const {
    return dispatch(text, labeler, config_.maxWordsPerChunk, config_.workerCount, labels);
}

DispatchResult ParallelDispatcher::dispatch(std::string_view text, const ILabeler& labeler,
                                            std::size_t maxWordsPerChunk,
                                            std::size_t workerCount,
                                            const std::vector<std::string>& labels) const {
    DispatchResult result;
    if (text.empty() || isBlank(text)) {
        spdlog::warn("Empty text provided for parallel extraction");
        return result;
    }

    chunking::WordChunker chunker(chunking::WordChunkingConfig{maxWordsPerChunk});
    const auto chunks = chunker.chunk(text);
    result.chunksTotal = chunks.size();
    if (chunks.empty()) {
        return result;
    }

    const auto processed = prepareLabels(labels);
    const std::size_t threads = std::clamp<std::size_t>(workerCount, 1, chunks.size());
    const float threshold = config_.threshold;

    spdlog::info("Starting parallel extraction: {} chunks on {} workers", chunks.size(), threads);

    std::vector<std::future<ChunkOutcome>> futures;
    futures.reserve(chunks.size());
    {
        boost::asio::thread_pool pool(threads);
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            auto task = std::make_shared<std::packaged_task<ChunkOutcome()>>(
                [&chunks, &labeler, &processed, i, threshold]() {
                    return labelChunk(chunks[i], i, labeler, processed, threshold);
                });
            futures.push_back(task->get_future());
            boost::asio::post(pool, [task]() { (*task)(); });
        }
        pool.join();
    }

    for (auto& f : futures) {
        ChunkOutcome outcome;
        try {
            outcome = f.get();
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        if (!outcome.success) {
            ++result.chunksFailed;
            spdlog::warn("Chunk {} (offset {}) failed: {}", outcome.index, outcome.offset,
                         outcome.error);
            continue;
        }
        ++result.chunksSucceeded;
        result.spans.insert(result.spans.end(), std::make_move_iterator(outcome.spans.begin()),
                            std::make_move_iterator(outcome.spans.end()));
    }

    sortByStart(result.spans);

    spdlog::info("Parallel extraction complete: {}/{} chunks succeeded, {} entities",
                 result.chunksSucceeded, result.chunksTotal, result.spans.size());
    return result;
}

} // namespace cloak::extraction
