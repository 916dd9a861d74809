// Catch2 tests for word-aligned chunking

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <cloak/chunking/word_chunker.h>

using namespace cloak::chunking;

namespace {
std::string words(std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) {
        if (i)
            out += (i % 7 == 0) ? "\n\t " : " ";
        out += "w" + std::to_string(i);
    }
    return out;
}
} // namespace

TEST_CASE("WordChunker - EmptyAndBlankInput", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{10});
    CHECK(chunker.chunk("").empty());
    CHECK(chunker.chunk("   \n\t  ").empty());
    CHECK(chunker.estimateChunkCount("") == 0);
}

TEST_CASE("WordChunker - SingleChunkWhenUnderLimit", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{10});
    const std::string text = "  Alice   met Bob  ";
    auto chunks = chunker.chunk(text);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].text == "Alice   met Bob");
    CHECK(chunks[0].offset == 2);
    CHECK(chunks[0].wordCount == 3);
}

TEST_CASE("WordChunker - OffsetsReproduceSource", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{5});
    const auto text = words(23);
    auto chunks = chunker.chunk(text);

    REQUIRE(chunks.size() == 5);
    CHECK(chunker.estimateChunkCount(text) == 5);
    for (const auto& c : chunks) {
        CHECK(text.substr(c.offset, c.text.size()) == c.text);
        CHECK(c.wordCount <= 5);
    }
    CHECK(chunks.back().wordCount == 3);
    CHECK(chunker.validateChunks(chunks, text));

    // Chunks are ordered and disjoint
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        CHECK(chunks[i - 1].end() < chunks[i].offset);
    }
}

TEST_CASE("WordChunker - ExactMultipleOfChunkSize", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{4});
    auto chunks = chunker.chunk(words(8));
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0].wordCount == 4);
    CHECK(chunks[1].wordCount == 4);
}

TEST_CASE("WordChunker - ZeroSizeFallsBackToDefault", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{0});
    CHECK(chunker.getConfig().maxWords == DEFAULT_MAX_WORDS);
}

TEST_CASE("WordChunker - ValidateRejectsTamperedChunks", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{3});
    const auto text = words(9);
    auto chunks = chunker.chunk(text);
    REQUIRE(chunker.validateChunks(chunks, text));

    auto shifted = chunks;
    shifted[1].offset += 1;
    CHECK_FALSE(chunker.validateChunks(shifted, text));

    auto outOfRange = chunks;
    outOfRange.back().offset = text.size();
    CHECK_FALSE(chunker.validateChunks(outOfRange, text));

    CHECK_FALSE(chunker.validateChunks({}, text));
}

TEST_CASE("WordChunker - DescribeSummarizesChunks", "[chunking][catch2]") {
    WordChunker chunker(WordChunkingConfig{2});
    auto chunks = chunker.chunk("aa bb ccc dddd e");
    REQUIRE(chunks.size() == 3);

    auto info = WordChunker::describe(chunks);
    CHECK(info.totalChunks == 3);
    CHECK(info.totalWords == 5);
    CHECK(info.minChunkSize == 1);
    CHECK(info.maxChunkSize == 8);
    CHECK(info.toJson()["total_chunks"] == 3);

    CHECK(WordChunker::describe({}).totalChunks == 0);
}

TEST_CASE("WordChunker - WordBoundariesSkipAllWhitespaceKinds", "[chunking][catch2]") {
    auto bounds = WordChunker::findWordBoundaries("a\tb\r\nc  d");
    REQUIRE(bounds.size() == 4);
    CHECK(bounds[0].start == 0);
    CHECK(bounds[1].start == 2);
    CHECK(bounds[2].start == 5);
    CHECK(bounds[3].start == 8);
    CHECK(bounds[3].end == 9);
}
