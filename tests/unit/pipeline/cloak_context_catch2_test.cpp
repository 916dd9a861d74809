// Catch2 tests for the end-to-end extraction and anonymization pipeline

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <cloak/pipeline/cloak_context.h>
#include <cloak/version.hpp>

#include "../../common/fake_labelers.h"

using namespace cloak;
using namespace cloak::pipeline;
using cloak::test::Phrase;
using cloak::test::PhraseLabeler;

namespace {
const std::string kMeeting = "John Smith met John Smith again in Paris.";

std::shared_ptr<PhraseLabeler> meetingLabeler() {
    return std::make_shared<PhraseLabeler>(std::vector<Phrase>{
        {"John Smith", "person", 0.9f}, {"Paris", "location", 0.8f}, {"Smith met", "person", 0.2f}});
}
} // namespace

TEST_CASE("CloakContext - NullLabelerRejected", "[pipeline][catch2]") {
    CHECK_THROWS_AS(CloakContext(config::CloakConfig{}, nullptr), std::invalid_argument);

    auto created = CloakContext::create(config::CloakConfig{}, nullptr);
    REQUIRE_FALSE(created);
    CHECK(created.error().code == ErrorCode::NotInitialized);
}

TEST_CASE("CloakContext - NotCopyableOrMovable", "[pipeline][catch2]") {
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<CloakContext>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<CloakContext>);
    STATIC_REQUIRE_FALSE(std::is_move_assignable_v<CloakContext>);

    auto created = CloakContext::create(config::CloakConfig{}, meetingLabeler(), nullptr, 3);
    REQUIRE(created.has_value());
    auto ctx = std::move(created).value();
    auto res = ctx->replace(kMeeting, {"person"});
    REQUIRE(res.has_value());
    CHECK(res.value().replacement.details.size() == 2);
}

TEST_CASE("CloakContext - CreateValidatesConfig", "[pipeline][catch2]") {
    config::CloakConfig bad;
    bad.extraction.maxPasses = 0;
    auto created = CloakContext::create(bad, meetingLabeler());
    REQUIRE_FALSE(created);
    CHECK(created.error().code == ErrorCode::InvalidArgument);

    config::CloakConfig missingCountries;
    missingCountries.replacement.countriesFile = "/nonexistent/cloak/countries.json";
    auto noFile = CloakContext::create(missingCountries, meetingLabeler());
    REQUIRE_FALSE(noFile);
    CHECK(noFile.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("CloakContext - BlankTextYieldsEmptyResult", "[pipeline][catch2]") {
    auto labeler = meetingLabeler();
    CloakContext ctx(config::CloakConfig{}, labeler);

    auto res = ctx.extract("   \n\t ");
    REQUIRE(res.has_value());
    CHECK(res.value().spans.empty());
    CHECK(res.value().info.method == "none");
    CHECK(labeler->calls() == 0);

    auto j = res.value().toJson();
    CHECK(j["version"] == CLOAK_VERSION_STRING);
    CHECK(j["entities"].empty());
}

TEST_CASE("CloakContext - ExtractFiltersAndOrders", "[pipeline][catch2]") {
    CloakContext ctx(config::CloakConfig{}, meetingLabeler());

    auto res = ctx.extract(kMeeting, {"Person", "LOCATION"});
    REQUIRE(res.has_value());
    const auto& spans = res.value().spans;
    REQUIRE(spans.size() == 3);
    CHECK(spans[0].text == "John Smith");
    CHECK(spans[1].start == 15);
    CHECK(spans[2].label == "location");

    const auto& info = res.value().info;
    CHECK(info.method == "single-pass");
    CHECK(info.labels == std::vector<std::string>{"person", "location"});
    CHECK(info.wordCount == 8);
    CHECK(info.validationApplied);
    CHECK(info.mergeApplied);
    REQUIRE(info.validationStats.has_value());
    CHECK(info.validationStats->validEntities == 3);

    auto j = res.value().toJson();
    CHECK(j["processing_info"]["method_used"] == "single-pass");
    CHECK(j["entities"].size() == 3);
}

TEST_CASE("CloakContext - LowConfidenceOverride", "[pipeline][catch2]") {
    CloakContext ctx(config::CloakConfig{}, meetingLabeler());

    ExtractOverrides strict;
    strict.minConfidence = 0.85f;
    auto res = ctx.extract(kMeeting, {"person", "location"}, strict);
    REQUIRE(res.has_value());
    CHECK(res.value().spans.size() == 2);

    ExtractOverrides invalid;
    invalid.minConfidence = 1.5f;
    auto bad = ctx.extract(kMeeting, {}, invalid);
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("CloakContext - RepeatedExtractionHitsCache", "[pipeline][catch2]") {
    auto labeler = meetingLabeler();
    CloakContext ctx(config::CloakConfig{}, labeler);

    auto first = ctx.extract(kMeeting);
    REQUIRE(first.has_value());
    CHECK_FALSE(first.value().info.cacheHit);
    const int callsAfterFirst = labeler->calls();

    auto second = ctx.extract(kMeeting);
    REQUIRE(second.has_value());
    CHECK(second.value().info.cacheHit);
    CHECK(labeler->calls() == callsAfterFirst);
    CHECK(second.value().spans == first.value().spans);
    REQUIRE(ctx.cache() != nullptr);
    CHECK(ctx.cache()->getStats().hits == 1);

    ctx.clearCache();
    CHECK(ctx.cache()->size() == 0);
}

TEST_CASE("CloakContext - ParallelPathMapsOffsets", "[pipeline][catch2]") {
    config::CloakConfig cfg;
    cfg.extraction.useCache = false;
    CloakContext ctx(cfg, meetingLabeler());
    REQUIRE(ctx.cache() == nullptr);

    ExtractOverrides overrides;
    overrides.parallel = true;
    overrides.chunkSize = 3;
    overrides.workerCount = 2;
    auto res = ctx.extract(kMeeting, {"person", "location"}, overrides);
    REQUIRE(res.has_value());

    const auto& info = res.value().info;
    CHECK(info.method == "parallel");
    REQUIRE(info.dispatch.has_value());
    CHECK(info.dispatch->chunksTotal == 3);
    CHECK(info.dispatch->chunksFailed == 0);

    CHECK(res.value().spans.size() == 3);
    for (const auto& s : res.value().spans) {
        CHECK(kMeeting.substr(s.start, s.end - s.start) == s.text);
    }
    CHECK(res.value().toJson()["processing_info"].contains("parallel"));
}

TEST_CASE("CloakContext - MergesAdjacentFragments", "[pipeline][catch2]") {
    auto labeler = std::make_shared<PhraseLabeler>(
        std::vector<Phrase>{{"John", "person", 0.8f}, {"Smith", "person", 0.6f}});
    CloakContext ctx(config::CloakConfig{}, labeler);

    auto res = ctx.extract("Ask John Smith today", {"person"});
    REQUIRE(res.has_value());
    REQUIRE(res.value().spans.size() == 1);
    CHECK(res.value().spans[0].text == "John Smith");
    CHECK(res.value().spans[0].start == 4);
    CHECK(res.value().spans[0].end == 14);
}

TEST_CASE("CloakContext - OverlapResolutionFollowsValidation", "[pipeline][catch2]") {
    auto labeler = std::make_shared<PhraseLabeler>(std::vector<Phrase>{
        {"New York", "location", 0.7f}, {"York Times", "organization", 0.9f}});

    config::CloakConfig cfg;
    cfg.extraction.mergeEntities = false;
    CloakContext ctx(cfg, labeler);
    auto resolved = ctx.extract("The New York Times", {"location", "organization"});
    REQUIRE(resolved.has_value());
    REQUIRE(resolved.value().spans.size() == 1);
    CHECK(resolved.value().spans[0].label == "organization");
    CHECK(resolved.value().info.overlapResolutionApplied);

    cfg.extraction.enableValidation = false;
    CloakContext raw(cfg, labeler);
    auto unresolved = raw.extract("The New York Times", {"location", "organization"});
    REQUIRE(unresolved.has_value());
    CHECK(unresolved.value().spans.size() == 2);
    CHECK_FALSE(unresolved.value().info.overlapResolutionApplied);
}

TEST_CASE("CloakContext - RedactEndToEnd", "[pipeline][catch2]") {
    CloakContext ctx(config::CloakConfig{}, meetingLabeler());

    auto res = ctx.redact(kMeeting, {"person", "location"});
    REQUIRE(res.has_value());
    CHECK(res.value().redaction.anonymizedText ==
          "#1_PERSON_REDACTED met #1_PERSON_REDACTED again in #1_LOCATION_REDACTED.");

    auto j = res.value().toJson();
    CHECK(j.contains("entities"));
    CHECK(j["redaction"]["redaction_info"]["redactions_applied"] == 3);
}

TEST_CASE("CloakContext - ReplaceEndToEnd", "[pipeline][catch2]") {
    const std::string text = "Event on 01/02/2020 and again on 01/02/2020.";
    auto labeler =
        std::make_shared<PhraseLabeler>(std::vector<Phrase>{{"01/02/2020", "date", 0.9f}});
    CloakContext ctx(config::CloakConfig{}, labeler, nullptr, 1234);

    auto res = ctx.replace(text, {"date"});
    REQUIRE(res.has_value());
    const auto& r = res.value().replacement;
    REQUIRE(r.details.size() == 2);
    CHECK(r.details[0].replacement == r.details[1].replacement);
    CHECK(std::regex_match(r.details[0].replacement, std::regex(R"(\d{2}/\d{2}/\d{4})")));
    CHECK(res.value().toJson().contains("replacement"));
}

TEST_CASE("CloakContext - ReplaceWithData", "[pipeline][catch2]") {
    CloakContext ctx(config::CloakConfig{}, meetingLabeler(), nullptr, 5);

    auto empty = ctx.replaceWithData(kMeeting, {"person"}, {});
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == ErrorCode::InvalidArgument);

    anonymization::UserValueMap values;
    values["person"] = std::string("Jane Roe");
    auto res = ctx.replaceWithData(kMeeting, {"person", "location"}, values);
    REQUIRE(res.has_value());
    CHECK(res.value().replacement.anonymizedText == "Jane Roe met Jane Roe again in Paris.");
}

TEST_CASE("CloakContext - AnonymizeProvidedSpans", "[pipeline][catch2]") {
    config::CloakConfig cfg;
    cfg.redaction.placeholderFormat = "<{label}>";
    CloakContext ctx(cfg, meetingLabeler());

    auto redacted = ctx.redactSpans("Call Bob", {{"person", "Bob", 5, 8, 0.9f}});
    REQUIRE(redacted.has_value());
    CHECK(redacted.value().anonymizedText == "Call <PERSON>");

    auto replaced = ctx.replaceSpans("Call Bob", {{"person", "Bob", 5, 8, 0.9f}});
    CHECK(replaced.details.size() == 1);
    CHECK(replaced.anonymizedText.rfind("Call ", 0) == 0);
}

TEST_CASE("CloakContext - InfoDescribesComponents", "[pipeline][catch2]") {
    CloakContext ctx(config::CloakConfig{}, meetingLabeler());
    auto j = ctx.info();
    CHECK(j["labeler"]["name"] == "phrase");
    CHECK(j["config"]["extraction"]["chunk_size"] == 600);
    CHECK(j.contains("cache"));
    CHECK(j["replacer"]["synthetic_available"] == true);
}

TEST_CASE("CloakContext - NonUtf8InputStillSerializes", "[pipeline][catch2]") {
    const std::string latin1 = "Jos\xe9 lives in Paris";
    CloakContext ctx(config::CloakConfig{}, meetingLabeler());

    auto res = ctx.redact(latin1, {"location"});
    REQUIRE(res.has_value());
    CHECK(res.value().redaction.anonymizedText == "Jos\xe9 lives in #1_LOCATION_REDACTED");

    const auto j = res.value().toJson();
    CHECK_THROWS(j.dump());

    std::string rendered;
    REQUIRE_NOTHROW(rendered = dumpJson(j));
    CHECK(rendered.find("Jos\xef\xbf\xbd lives in #1_LOCATION_REDACTED") != std::string::npos);
    CHECK(nlohmann::json::parse(rendered)["processing_info"]["entities_found"] == 1);

    REQUIRE_NOTHROW(rendered = dumpJson(j, 2));
    CHECK(rendered.find("\n  \"entities\"") != std::string::npos);
}
