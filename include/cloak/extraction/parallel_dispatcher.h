#pragma once

#include <cloak/chunking/word_chunker.h>
#include <cloak/entity/span.h>
#include <cloak/extraction/labeler.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cloak::extraction {

struct DispatchConfig {
    std::size_t maxWordsPerChunk = chunking::DEFAULT_MAX_WORDS;
    std::size_t workerCount = 4;
    float threshold = 0.3f;
};

// Per-chunk task result; failures are values, never exceptions crossing the pool
struct ChunkOutcome {
    std::size_t index = 0;
    std::size_t offset = 0;
    bool success = false;
    std::string error;
    SpanList spans;
};

struct DispatchResult {
    SpanList spans;
    std::size_t chunksTotal = 0;
    std::size_t chunksSucceeded = 0;
    std::size_t chunksFailed = 0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"chunks_total", chunksTotal},
                              {"chunks_succeeded", chunksSucceeded},
                              {"chunks_failed", chunksFailed},
                              {"entities", spans.size()}};
    }
};

/**
 * @brief Fork-join labeling over word-aligned chunks.
 *
 * One task per chunk runs on a bounded boost::asio::thread_pool. Each task labels its
 * chunk and shifts the returned spans by the chunk offset. The call returns only after
 * every task has finished; a failed task is logged and left out of the aggregate.
 */
class ParallelDispatcher {
public:
    explicit ParallelDispatcher(DispatchConfig config = {});

    DispatchResult dispatch(std::string_view text, const ILabeler& labeler,
                            const std::vector<std::string>& labels) const;

    DispatchResult dispatch(std::string_view text, const ILabeler& labeler,
                            std::size_t maxWordsPerChunk, std::size_t workerCount,
                            const std::vector<std::string>& labels) const;

    const DispatchConfig& getConfig() const { return config_; }

    // True when the word count exceeds the chunk size threshold
    static bool shouldDispatch(std::string_view text, std::size_t maxWordsPerChunk);

private:
    static ChunkOutcome labelChunk(const chunking::TextChunk& chunk, std::size_t index,
                                   const ILabeler& labeler,
                                   const std::vector<std::string>& labels, float threshold);

    DispatchConfig config_;
};

} // namespace cloak::extraction
