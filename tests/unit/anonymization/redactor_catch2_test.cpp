// Catch2 tests for reversible placeholder redaction

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <cloak/anonymization/redactor.h>

using namespace cloak;
using namespace cloak::anonymization;

namespace {
const std::string kMeeting = "John Smith met John Smith again in Paris.";

SpanList meetingSpans() {
    return {{"person", "John Smith", 0, 10, 0.9f},
            {"person", "John Smith", 15, 25, 0.9f},
            {"location", "Paris", 35, 40, 0.8f}};
}
} // namespace

TEST_CASE("EntityRedactor - ConsistentNumberedPlaceholders", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    auto res = redactor.redact(kMeeting, meetingSpans());
    REQUIRE(res.has_value());

    const auto& r = res.value();
    CHECK(r.anonymizedText ==
          "#1_PERSON_REDACTED met #1_PERSON_REDACTED again in #1_LOCATION_REDACTED.");
    REQUIRE(r.details.size() == 3);
    CHECK(r.details[0].placeholder == "#1_PERSON_REDACTED");
    CHECK(r.details[0].redactionId == "1");
    CHECK(r.details[0].label == "PERSON");
    CHECK(r.details[2].original == "Paris");
    CHECK(r.reIdentificationMap.at("#1_PERSON_REDACTED") == "John Smith");
    CHECK(r.reIdentificationMap.at("#1_LOCATION_REDACTED") == "Paris");
    CHECK(r.info.redactionsApplied == 3);
    CHECK(r.info.uniqueEntities == 2);
    CHECK(r.info.formatUsed == DEFAULT_PLACEHOLDER_FORMAT);
}

TEST_CASE("EntityRedactor - DistinctEntitiesGetIncreasingIds",
          "[anonymization][redactor][catch2]") {
    const std::string text = "Ann, Ben and Ann";
    EntityRedactor redactor;
    auto res = redactor.redact(text, {{"person", "Ben", 5, 8, 0.9f},
                                      {"person", "Ann", 0, 3, 0.9f},
                                      {"person", "Ann", 13, 16, 0.9f}});
    REQUIRE(res.has_value());
    CHECK(res.value().anonymizedText ==
          "#1_PERSON_REDACTED, #2_PERSON_REDACTED and #1_PERSON_REDACTED");
}

TEST_CASE("EntityRedactor - IdsRestartPerCall", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    auto first = redactor.redact("Ann", {{"person", "Ann", 0, 3, 0.9f}});
    auto second = redactor.redact("Ben", {{"person", "Ben", 0, 3, 0.9f}});
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(second.value().anonymizedText == "#1_PERSON_REDACTED");

    auto stats = redactor.stats();
    CHECK(stats.totalUniqueEntities == 2);
    CHECK(stats.labels.at("PERSON").maxIdUsed == 1);

    redactor.clearHistory();
    CHECK(redactor.stats().totalUniqueEntities == 0);
}

TEST_CASE("EntityRedactor - InconsistentIdsNumberEveryOccurrence",
          "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    RedactOptions opts;
    opts.consistentIds = false;
    auto res = redactor.redact(kMeeting, meetingSpans(), opts);
    REQUIRE(res.has_value());
    CHECK(res.value().anonymizedText ==
          "#1_PERSON_REDACTED met #2_PERSON_REDACTED again in #1_LOCATION_REDACTED.");
}

TEST_CASE("EntityRedactor - CustomAndMalformedTemplates", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;

    RedactOptions custom;
    custom.format = "<{label}:{count}>";
    auto res = redactor.redact(kMeeting, meetingSpans(), custom);
    REQUIRE(res.has_value());
    CHECK(res.value().anonymizedText == "<PERSON:1> met <PERSON:1> again in <LOCATION:1>.");

    RedactOptions broken;
    broken.format = "{id";
    auto bad = redactor.redact(kMeeting, meetingSpans(), broken);
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);

    RedactOptions unknownField;
    unknownField.format = "{name}";
    CHECK_FALSE(redactor.redact(kMeeting, meetingSpans(), unknownField));

    CHECK(EntityRedactor::renderPlaceholder("[{label}-{id}]", 7, "EMAIL").value() == "[EMAIL-7]");
}

TEST_CASE("EntityRedactor - NonNumberedMode", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    RedactOptions opts;
    opts.numbered = false;
    opts.format = "{broken"; // Never rendered
    auto res = redactor.redact(kMeeting, meetingSpans(), opts);
    REQUIRE(res.has_value());
    CHECK(res.value().anonymizedText ==
          "PERSON_REDACTED met PERSON_REDACTED again in LOCATION_REDACTED.");
    CHECK(res.value().details[0].redactionId == "PERSON_STATIC");
}

TEST_CASE("EntityRedactor - SkipsInvalidAndOverlappingSpans",
          "[anonymization][redactor][catch2]") {
    const std::string text = "Bob Marley sings";
    EntityRedactor redactor;
    auto res = redactor.redact(text, {{"person", "Bob Marley", 0, 10, 0.9f},
                                      {"person", "Marley", 4, 10, 0.9f},
                                      {"person", "ghost", 14, 99, 0.9f}});
    REQUIRE(res.has_value());
    const auto& r = res.value();
    CHECK(r.info.entitiesProcessed == 3);
    CHECK(r.info.entitiesSkipped == 2);
    CHECK(r.details.size() == 1);
    CHECK(r.anonymizedText.find("Marley") == std::string::npos);
    CHECK(r.anonymizedText.find("sings") != std::string::npos);
}

TEST_CASE("EntityRedactor - EmptySpansReturnTextUnchanged", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    auto res = redactor.redact(kMeeting, {});
    REQUIRE(res.has_value());
    CHECK(res.value().anonymizedText == kMeeting);
    CHECK(res.value().details.empty());
}

TEST_CASE("EntityRedactor - BatchSharesIdsAcrossTexts", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    std::vector<std::string> texts{"Ann called Ben", "Ben called Cy", "Ann again"};
    std::vector<SpanList> spans{
        {{"person", "Ann", 0, 3, 0.9f}, {"person", "Ben", 11, 14, 0.9f}},
        {{"person", "Ben", 0, 3, 0.9f}, {"person", "Cy", 11, 13, 0.9f}},
        {{"person", "Ann", 0, 3, 0.9f}}};

    auto res = redactor.batchRedact(texts, spans);
    REQUIRE(res.has_value());
    REQUIRE(res.value().size() == 3);
    CHECK(res.value()[0].anonymizedText == "#1_PERSON_REDACTED called #2_PERSON_REDACTED");
    CHECK(res.value()[1].anonymizedText == "#2_PERSON_REDACTED called #3_PERSON_REDACTED");
    CHECK(res.value()[2].anonymizedText == "#1_PERSON_REDACTED again");

    auto mismatch = redactor.batchRedact(texts, {});
    REQUIRE_FALSE(mismatch);
    CHECK(mismatch.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("EntityRedactor - ResultJson", "[anonymization][redactor][catch2]") {
    EntityRedactor redactor;
    auto res = redactor.redact(kMeeting, meetingSpans());
    REQUIRE(res.has_value());
    auto j = res.value().toJson();
    CHECK(j["replacements"].size() == 3);
    CHECK(j["replacements"][0]["redaction_id"] == "1");
    CHECK(j["redaction_info"]["unique_entities"] == 2);
    CHECK(j["re_identification_map"]["#1_LOCATION_REDACTED"] == "Paris");
}
