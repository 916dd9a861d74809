#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <cloak/config/cloak_config.h>
#include <cloak/extraction/gazetteer_labeler.h>
#include <cloak/pipeline/cloak_context.h>
#include <cloak/version.hpp>

namespace {

using cloak::Error;
using cloak::ErrorCode;
using cloak::Result;

Result<std::string> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "cannot open file: " + path};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Result<nlohmann::json> readJsonFile(const std::string& path) {
    auto content = readFile(path);
    if (!content) {
        return content.error();
    }
    auto doc = nlohmann::json::parse(content.value(), nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, "not valid JSON: " + path};
    }
    return doc;
}

// {"label": "value"} or {"label": ["a", "b"]}
Result<cloak::anonymization::UserValueMap> loadUserData(const std::string& path) {
    auto doc = readJsonFile(path);
    if (!doc) {
        return doc.error();
    }
    if (!doc.value().is_object()) {
        return Error{ErrorCode::InvalidData, "user data must be a JSON object: " + path};
    }

    cloak::anonymization::UserValueMap values;
    for (const auto& [label, v] : doc.value().items()) {
        if (v.is_string()) {
            values.emplace(label, v.get<std::string>());
        } else if (v.is_array()) {
            std::vector<std::string> choices;
            for (const auto& item : v) {
                if (item.is_string()) {
                    choices.push_back(item.get<std::string>());
                }
            }
            values.emplace(label, std::move(choices));
        } else {
            return Error{ErrorCode::InvalidData,
                         "user data for '" + label + "' must be a string or list of strings"};
        }
    }
    return values;
}

// A JSON array of spans, or an object holding one under "entities"
Result<cloak::SpanList> loadSpans(const std::string& path) {
    auto doc = readJsonFile(path);
    if (!doc) {
        return doc.error();
    }
    const auto& root = doc.value();
    const auto& arr = root.is_object() && root.contains("entities") ? root["entities"] : root;
    if (!arr.is_array()) {
        return Error{ErrorCode::InvalidData, "span file must hold a JSON array: " + path};
    }

    cloak::SpanList spans;
    try {
        for (const auto& item : arr) {
            spans.push_back(cloak::Span::fromJson(item));
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed span: ") + e.what()};
    }
    return spans;
}

void setupLogging(bool verbose, bool quiet) {
    auto logger = std::make_shared<spdlog::logger>(
        "cloak", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    spdlog::set_default_logger(logger);
    if (verbose)
        spdlog::set_level(spdlog::level::debug);
    else if (quiet)
        spdlog::set_level(spdlog::level::warn);
    else
        spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
}

int fail(const Error& error) {
    std::cerr << "Error: " << error.message << " (" << cloak::errorToString(error.code) << ")"
              << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"cloak - detect and anonymize entities in text"};
    app.set_version_flag("--version", std::string(CLOAK_VERSION_LONG_STRING));

    std::string configPath;
    std::string text;
    std::string textFile;
    std::vector<std::string> labels;
    std::string gazetteerFile;
    std::string mode = "extract";
    std::string userDataFile;
    std::string spansFile;
    std::string placeholder;
    std::optional<float> minConfidence;
    std::optional<std::size_t> chunkSize;
    std::optional<std::size_t> workers;
    bool forceParallel = false;
    bool forceSinglePass = false;
    std::string overlapStrategy;
    std::optional<std::uint64_t> seed;
    std::string outputFile;
    bool pretty = false;
    bool verbose = false;
    bool quiet = false;
    bool showInfo = false;

    app.add_option("-c,--config", configPath, "Config file (default: $XDG_CONFIG_HOME/cloak/config.toml)");
    auto* textOpt = app.add_option("-t,--text", text, "Input text");
    auto* fileOpt = app.add_option("-f,--text-file", textFile, "Read input text from a file")
                        ->check(CLI::ExistingFile);
    textOpt->excludes(fileOpt);
    app.add_option("-l,--labels", labels, "Entity labels to extract")->delimiter(',');
    app.add_option("-g,--gazetteer", gazetteerFile, "Gazetteer JSON with aliases and patterns")
        ->check(CLI::ExistingFile);
    app.add_option("-m,--mode", mode, "extract | redact | replace | user-data")
        ->check(CLI::IsMember({"extract", "redact", "replace", "user-data"}))
        ->default_val("extract");
    app.add_option("--user-data", userDataFile, "JSON object mapping label to value(s)")
        ->check(CLI::ExistingFile);
    app.add_option("--spans", spansFile, "Anonymize these spans instead of extracting")
        ->check(CLI::ExistingFile);
    app.add_option("--placeholder", placeholder, "Redaction template using {id} {label} {count}");
    app.add_option("--min-confidence", minConfidence, "Minimum span confidence")
        ->check(CLI::Range(0.0f, 1.0f));
    app.add_option("--chunk-size", chunkSize, "Words per chunk for parallel extraction")
        ->check(CLI::PositiveNumber);
    app.add_option("--workers", workers, "Worker threads for parallel extraction")
        ->check(CLI::PositiveNumber);
    auto* parallelFlag = app.add_flag("--parallel", forceParallel, "Force parallel extraction");
    auto* singleFlag =
        app.add_flag("--single-pass", forceSinglePass, "Force multi-pass extraction");
    parallelFlag->excludes(singleFlag);
    app.add_option("--overlap-strategy", overlapStrategy, "highest_confidence | longest | first");
    app.add_option("--seed", seed, "Seed for reproducible replacements");
    app.add_option("-o,--output", outputFile, "Write JSON result to a file instead of stdout");
    app.add_flag("--pretty", pretty, "Indent JSON output");
    auto* verboseFlag = app.add_flag("-v,--verbose", verbose, "Debug logging");
    auto* quietFlag = app.add_flag("-q,--quiet", quiet, "Only warnings and errors");
    verboseFlag->excludes(quietFlag);
    app.add_flag("--info", showInfo, "Print configuration and component info");

    CLI11_PARSE(app, argc, argv);

    setupLogging(verbose, quiet);

    try {
        auto cfg = cloak::config::loadConfig(configPath);
        if (!cfg) {
            return fail(cfg.error());
        }
        auto config = std::move(cfg).value();
        if (!placeholder.empty()) {
            config.redaction.placeholderFormat = placeholder;
        }

        cloak::pipeline::ExtractOverrides overrides;
        overrides.minConfidence = minConfidence;
        overrides.chunkSize = chunkSize;
        overrides.workerCount = workers;
        if (forceParallel)
            overrides.parallel = true;
        else if (forceSinglePass)
            overrides.parallel = false;
        if (!overlapStrategy.empty()) {
            auto strategy = cloak::validation::parseOverlapStrategy(overlapStrategy);
            if (!strategy) {
                return fail(strategy.error());
            }
            overrides.overlapStrategy = strategy.value();
        }

        auto labeler = std::make_shared<cloak::extraction::GazetteerLabeler>();
        if (auto r = labeler->addDefaultPatterns(); !r) {
            return fail(r.error());
        }
        if (!gazetteerFile.empty()) {
            if (auto r = labeler->loadFromFile(gazetteerFile); !r) {
                return fail(r.error());
            }
        }

        auto created = cloak::pipeline::CloakContext::create(config, labeler, nullptr, seed);
        if (!created) {
            return fail(created.error());
        }
        auto& ctx = *created.value();

        nlohmann::json output;
        if (showInfo) {
            output = ctx.info();
        } else {
            std::string input = text;
            if (!textFile.empty()) {
                auto content = readFile(textFile);
                if (!content) {
                    return fail(content.error());
                }
                input = std::move(content).value();
            } else if (textOpt->count() == 0) {
                std::ostringstream buf;
                buf << std::cin.rdbuf();
                input = buf.str();
            }

            std::optional<cloak::SpanList> givenSpans;
            if (!spansFile.empty()) {
                auto spans = loadSpans(spansFile);
                if (!spans) {
                    return fail(spans.error());
                }
                givenSpans = std::move(spans).value();
            }

            if (mode == "extract") {
                auto r = ctx.extract(input, labels, overrides);
                if (!r) {
                    return fail(r.error());
                }
                output = r.value().toJson();
            } else if (mode == "redact") {
                if (givenSpans) {
                    auto r = ctx.redactSpans(input, *givenSpans);
                    if (!r) {
                        return fail(r.error());
                    }
                    output = r.value().toJson();
                } else {
                    auto r = ctx.redact(input, labels, overrides);
                    if (!r) {
                        return fail(r.error());
                    }
                    output = r.value().toJson();
                }
            } else if (mode == "replace") {
                if (givenSpans) {
                    output = ctx.replaceSpans(input, *givenSpans).toJson();
                } else {
                    auto r = ctx.replace(input, labels, overrides);
                    if (!r) {
                        return fail(r.error());
                    }
                    output = r.value().toJson();
                }
            } else {
                if (userDataFile.empty()) {
                    return fail(Error{ErrorCode::InvalidArgument,
                                      "--mode user-data requires --user-data FILE"});
                }
                auto values = loadUserData(userDataFile);
                if (!values) {
                    return fail(values.error());
                }
                if (givenSpans) {
                    output =
                        ctx.replacer().replaceWithUserData(input, *givenSpans, values.value())
                            .toJson();
                } else {
                    auto r = ctx.replaceWithData(input, labels, values.value(), overrides);
                    if (!r) {
                        return fail(r.error());
                    }
                    output = r.value().toJson();
                }
            }
        }

        const auto rendered = cloak::dumpJson(output, pretty ? 2 : -1);
        if (outputFile.empty()) {
            std::cout << rendered << std::endl;
        } else {
            std::ofstream out(outputFile);
            if (!out) {
                return fail(Error{ErrorCode::InvalidArgument, "cannot write " + outputFile});
            }
            out << rendered << '\n';
            spdlog::info("Wrote result to {}", outputFile);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
