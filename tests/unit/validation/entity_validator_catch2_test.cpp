// Catch2 tests for span validation and overlap resolution

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>

#include <cloak/validation/entity_validator.h>

using namespace cloak;
using namespace cloak::validation;

TEST_CASE("EntityValidator - ConfidenceFilter", "[validation][catch2]") {
    const std::string text = "Bob met Alice";
    EntityValidator validator(ValidatorConfig{0.5f, true});

    SpanList spans{{"person", "Bob", 0, 3, 0.9f},
                   {"person", "Alice", 8, 13, 0.2f},
                   {"person", "met", 4, 7, std::numeric_limits<float>::quiet_NaN()}};
    auto valid = validator.validate(spans, text);
    REQUIRE(valid.size() == 1);
    CHECK(valid[0].text == "Bob");

    const auto& stats = validator.getStats();
    CHECK(stats.totalEntities == 3);
    CHECK(stats.confidenceFiltered == 2);
    CHECK(stats.validEntities == 1);

    // Per-call threshold overrides the configured one and resets the stats
    auto lenient = validator.validate(spans, text, 0.1f);
    CHECK(lenient.size() == 2);
    CHECK(validator.getStats().confidenceFiltered == 1);
}

TEST_CASE("EntityValidator - PositionChecks", "[validation][catch2]") {
    const std::string text = "short text";
    EntityValidator validator;

    SpanList spans{{"person", "short", 0, 5, 0.9f},
                   {"person", "x", 6, 6, 0.9f},
                   {"person", "beyond", 8, 40, 0.9f},
                   {"person", "far", 50, 53, 0.9f}};
    auto valid = validator.validate(spans, text);
    REQUIRE(valid.size() == 1);
    CHECK(validator.getStats().positionInvalid == 3);

    const std::string longText(300, 'a');
    CHECK_FALSE(validator.checkPosition(Span{"x", "", 0, MAX_ENTITY_LENGTH + 1, 1.0f}, longText));
    CHECK(validator.checkPosition(Span{"x", "", 0, MAX_ENTITY_LENGTH, 1.0f}, longText));
}

TEST_CASE("EntityValidator - TextConsistency", "[validation][catch2]") {
    const std::string text = "Dr.  Jane\nDoe works here";
    EntityValidator validator;

    // Whitespace differences are tolerated
    CHECK(validator.checkTextConsistency(Span{"person", "Dr. Jane Doe", 0, 13, 0.9f}, text));
    // Case differences are tolerated
    CHECK(validator.checkTextConsistency(Span{"person", "dr.  jane\ndoe", 0, 13, 0.9f}, text));
    // Containment either way is tolerated
    CHECK(validator.checkTextConsistency(Span{"person", "Jane", 0, 13, 0.9f}, text));
    CHECK(validator.checkTextConsistency(Span{"person", "Dr.  Jane\nDoe works", 0, 13, 0.9f},
                                         text));
    // Unrelated text is rejected
    CHECK_FALSE(validator.checkTextConsistency(Span{"person", "Bob", 0, 13, 0.9f}, text));

    auto valid = validator.validate({{"person", "Bob", 0, 13, 0.9f}}, text);
    CHECK(valid.empty());
    CHECK(validator.getStats().textMismatch == 1);
}

TEST_CASE("EntityValidator - CleanRereadsSourceAndLowercasesLabel", "[validation][catch2]") {
    const std::string text = "Hello  Bob  there";
    EntityValidator validator;

    auto valid = validator.validate({{" PERSON ", "bob", 6, 11, 0.9f}}, text);
    REQUIRE(valid.size() == 1);
    CHECK(valid[0].label == "person");
    CHECK(valid[0].text == "Bob");
    CHECK(valid[0].start == 6);
    CHECK(valid[0].end == 11);
}

TEST_CASE("EntityValidator - LenientModeOnlyChecksConfidence", "[validation][catch2]") {
    EntityValidator validator(ValidatorConfig{0.3f, false});
    auto valid = validator.validate({{"person", "ghost", 90, 95, 0.9f}}, "tiny");
    REQUIRE(valid.size() == 1);
    CHECK(valid[0].text == "ghost");
}

TEST_CASE("EntityValidator - StatsJson", "[validation][catch2]") {
    EntityValidator validator;
    auto empty = validator.getStats().toJson();
    CHECK_FALSE(empty.contains("validation_success_rate"));

    validator.validate({{"person", "Bob", 0, 3, 0.9f}, {"person", "Bob", 0, 3, 0.1f}}, "Bob");
    auto j = validator.getStats().toJson();
    CHECK(j["total_entities"] == 2);
    CHECK(j["validation_success_rate"] == 0.5);
}

TEST_CASE("EntityValidator - DetectOverlaps", "[validation][catch2]") {
    SpanList spans{{"a", "", 0, 5, 0.5f}, {"b", "", 4, 8, 0.5f}, {"c", "", 8, 10, 0.5f}};
    auto pairs = EntityValidator::detectOverlaps(spans);
    REQUIRE(pairs.size() == 1);
    CHECK(pairs[0].first == 0);
    CHECK(pairs[0].second == 1);
}

TEST_CASE("EntityValidator - ResolveOverlapsStrategies", "[validation][catch2]") {
    EntityValidator validator;
    SpanList spans{{"person", "New York", 0, 8, 0.6f},
                   {"location", "York City", 4, 13, 0.9f},
                   {"date", "today", 20, 25, 0.5f}};

    SECTION("highest confidence") {
        auto out = validator.resolveOverlaps(spans, OverlapStrategy::HighestConfidence);
        REQUIRE(out.size() == 2);
        CHECK(out[0].text == "York City");
        CHECK(out[1].text == "today");
    }
    SECTION("longest") {
        auto out = validator.resolveOverlaps(spans, OverlapStrategy::Longest);
        REQUIRE(out.size() == 2);
        CHECK(out[0].text == "York City");
    }
    SECTION("first") {
        auto out = validator.resolveOverlaps(spans, OverlapStrategy::First);
        REQUIRE(out.size() == 2);
        CHECK(out[0].text == "New York");
    }
    SECTION("ties keep the earlier span") {
        SpanList tied{{"a", "", 0, 5, 0.7f}, {"b", "", 2, 7, 0.7f}};
        auto out = validator.resolveOverlaps(tied, OverlapStrategy::HighestConfidence);
        REQUIRE(out.size() == 1);
        CHECK(out[0].label == "a");
        out = validator.resolveOverlaps(tied, OverlapStrategy::Longest);
        REQUIRE(out.size() == 1);
        CHECK(out[0].label == "a");
    }
}

TEST_CASE("EntityValidator - ResolvedSpansNeverOverlap", "[validation][catch2]") {
    EntityValidator validator;
    SpanList chain{{"a", "", 0, 4, 0.5f},
                   {"b", "", 3, 7, 0.9f},
                   {"c", "", 6, 10, 0.4f},
                   {"d", "", 9, 13, 0.8f},
                   {"e", "", 2, 12, 0.3f}};
    for (auto strategy :
         {OverlapStrategy::HighestConfidence, OverlapStrategy::Longest, OverlapStrategy::First}) {
        auto out = validator.resolveOverlaps(chain, strategy);
        CHECK(EntityValidator::detectOverlaps(out).empty());
        CHECK_FALSE(out.empty());
    }
}

TEST_CASE("EntityValidator - ParseOverlapStrategy", "[validation][catch2]") {
    CHECK(parseOverlapStrategy("longest").value() == OverlapStrategy::Longest);
    CHECK(parseOverlapStrategy(" FIRST ").value() == OverlapStrategy::First);
    auto bad = parseOverlapStrategy("random");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}
