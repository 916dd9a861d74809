#include <cloak/chunking/word_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace cloak::chunking {

WordChunker::WordChunker(WordChunkingConfig config) : config_(config) {
    if (config_.maxWords == 0) {
        spdlog::warn("Invalid chunk size 0, using default {}", DEFAULT_MAX_WORDS);
        config_.maxWords = DEFAULT_MAX_WORDS;
    }
}

std::vector<WordBoundary> WordChunker::findWordBoundaries(std::string_view text) {
    std::vector<WordBoundary> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i >= text.size()) {
            break;
        }
        const std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        words.push_back({start, i});
    }
    return words;
}

std::vector<TextChunk> WordChunker::chunk(std::string_view text) const {
    auto words = findWordBoundaries(text);
    if (words.empty()) {
        spdlog::debug("No words found in text, nothing to chunk");
        return {};
    }

    std::vector<TextChunk> chunks;
    chunks.reserve((words.size() + config_.maxWords - 1) / config_.maxWords);

    for (std::size_t i = 0; i < words.size(); i += config_.maxWords) {
        const std::size_t last = std::min(i + config_.maxWords, words.size()) - 1;
        const std::size_t begin = words[i].start;
        const std::size_t end = words[last].end;

        TextChunk c;
        c.text = std::string(text.substr(begin, end - begin));
        c.offset = begin;
        c.wordCount = last - i + 1;
        chunks.push_back(std::move(c));
    }

    spdlog::debug("Text chunked into {} chunks (chunk_size={} words)", chunks.size(),
                  config_.maxWords);
    return chunks;
}

bool WordChunker::validateChunks(const std::vector<TextChunk>& chunks,
                                 std::string_view original) const {
    if (chunks.empty() || original.empty()) {
        return false;
    }

    for (const auto& c : chunks) {
        if (c.offset >= original.size()) {
            spdlog::error("Invalid chunk offset: {}", c.offset);
            return false;
        }
        if (c.end() > original.size()) {
            spdlog::error("Chunk extends beyond text length: {} > {}", c.end(), original.size());
            return false;
        }
        if (original.substr(c.offset, c.text.size()) != c.text) {
            spdlog::error("Chunk mismatch at offset {}", c.offset);
            return false;
        }
    }
    return true;
}

std::size_t WordChunker::estimateChunkCount(std::string_view text) const {
    if (text.empty()) {
        return 0;
    }
    const auto words = findWordBoundaries(text).size();
    return (words + config_.maxWords - 1) / config_.maxWords;
}

ChunkInfo WordChunker::describe(const std::vector<TextChunk>& chunks) {
    ChunkInfo info;
    if (chunks.empty()) {
        return info;
    }

    info.totalChunks = chunks.size();
    info.minChunkSize = chunks.front().text.size();
    for (const auto& c : chunks) {
        info.totalCharacters += c.text.size();
        info.totalWords += c.wordCount;
        info.minChunkSize = std::min(info.minChunkSize, c.text.size());
        info.maxChunkSize = std::max(info.maxChunkSize, c.text.size());
    }
    info.averageChunkSize =
        static_cast<double>(info.totalCharacters) / static_cast<double>(info.totalChunks);
    info.averageWordsPerChunk =
        static_cast<double>(info.totalWords) / static_cast<double>(info.totalChunks);
    return info;
}

} // namespace cloak::chunking
