#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cloak::chunking {

inline constexpr std::size_t DEFAULT_MAX_WORDS = 600;

/**
 * Configuration for word-aligned chunking
 */
struct WordChunkingConfig {
    std::size_t maxWords = DEFAULT_MAX_WORDS; // Maximum whitespace-delimited words per chunk
};

/**
 * A word-aligned slice of the source text. `text` is the exact original substring
 * from the first word's start to the last word's end.
 */
struct TextChunk {
    std::string text;
    std::size_t offset = 0; // Byte offset of text[0] in the source
    std::size_t wordCount = 0;

    std::size_t end() const { return offset + text.size(); }

    bool operator==(const TextChunk&) const = default;
};

/**
 * Byte range of a single word in the source
 */
struct WordBoundary {
    std::size_t start = 0;
    std::size_t end = 0;
};

/**
 * Summary statistics over a chunk list
 */
struct ChunkInfo {
    std::size_t totalChunks = 0;
    std::size_t totalCharacters = 0;
    double averageChunkSize = 0.0;
    std::size_t minChunkSize = 0;
    std::size_t maxChunkSize = 0;
    std::size_t totalWords = 0;
    double averageWordsPerChunk = 0.0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"total_chunks", totalChunks},
                              {"total_characters", totalCharacters},
                              {"average_chunk_size", averageChunkSize},
                              {"min_chunk_size", minChunkSize},
                              {"max_chunk_size", maxChunkSize},
                              {"total_words", totalWords},
                              {"average_words_per_chunk", averageWordsPerChunk}};
    }
};

/**
 * Splits text into groups of at most `maxWords` words without ever splitting a word.
 * Internal whitespace inside a chunk is preserved verbatim; whitespace between chunks
 * belongs to no chunk.
 */
class WordChunker {
public:
    explicit WordChunker(WordChunkingConfig config = {});

    const WordChunkingConfig& getConfig() const { return config_; }

    // Empty or whitespace-only input yields no chunks
    std::vector<TextChunk> chunk(std::string_view text) const;

    // Re-derive every chunk from (text, offset) and compare with the source
    bool validateChunks(const std::vector<TextChunk>& chunks, std::string_view original) const;

    std::size_t estimateChunkCount(std::string_view text) const;

    static std::vector<WordBoundary> findWordBoundaries(std::string_view text);
    static ChunkInfo describe(const std::vector<TextChunk>& chunks);

private:
    WordChunkingConfig config_;
};

} // namespace cloak::chunking
