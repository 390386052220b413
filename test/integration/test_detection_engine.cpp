// test/integration/test_detection_engine.cpp
// -----------------------------------------------------------
// End to end: pattern scan + dictionary tagging + confidence pipeline.

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/detection_engine.hpp"
#include "engine_config.hpp"
#include "util/config_parser.hpp"

namespace {

using phiscan::config::EngineConfig;
using phiscan::core::DetectionEngine;
using phiscan::core::Span;

const std::string kNote = "Patient: John Smith, SSN: 219-09-9999, DOB 01/02/1980.";

const Span *findSpan(const std::vector<Span> &spans, const std::string &type, const std::string &text)
{
    for (const auto &s : spans) {
        if (s.filterType == type && s.text == text) {
            return &s;
        }
    }
    return nullptr;
}

EngineConfig testConfig()
{
    EngineConfig cfg;
    cfg.workerThreads = 2;
    return cfg;
}

TEST(DetectionEngineTest, DetectsPatternsAndDictionaryTerms) {
    DetectionEngine engine(testConfig());
    engine.addDictionary("NAME", {"john", "smith"});

    auto result = engine.detect(kNote);

    EXPECT_GT(result.patternCandidates, (size_t)0);
    EXPECT_EQ(result.dictionaryCandidates, (size_t)2);
    EXPECT_EQ(result.spans.size(), result.patternCandidates + result.dictionaryCandidates);
    EXPECT_GE(result.totalTimeMs, result.scanTimeMs);

    const Span *ssn = findSpan(result.spans, "SSN", "219-09-9999");
    ASSERT_NE(ssn, nullptr);
    EXPECT_EQ(ssn->characterStart, kNote.find("219"));
    EXPECT_GT(ssn->confidence, 0.9);

    const Span *john = findSpan(result.spans, "NAME", "John");
    ASSERT_NE(john, nullptr);
    EXPECT_EQ(john->pattern, "FUZZY_NAME_EXACT");
    EXPECT_EQ(john->characterStart, (size_t)9);

    EXPECT_NE(findSpan(result.spans, "DATE", "01/02/1980"), nullptr);

    for (const auto &s : result.spans) {
        EXPECT_GE(s.confidence, 0.0);
        EXPECT_LE(s.confidence, 1.0);
        EXPECT_LE(s.characterEnd, kNote.size());
        EXPECT_EQ(kNote.substr(s.characterStart, s.characterEnd - s.characterStart), s.text);
    }

    auto summary = engine.lastSummary();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->totalStages, (size_t)7);
    EXPECT_EQ(summary->inputSpanCount, result.spans.size());
}

TEST(DetectionEngineTest, EmptyDocument) {
    DetectionEngine engine(testConfig());
    auto result = engine.detect("");
    EXPECT_TRUE(result.spans.empty());
    EXPECT_EQ(result.patternCandidates, (size_t)0);
}

TEST(DetectionEngineTest, LoadsConfiguredDictionaries) {
    const std::string dictFile = "test_engine_names.txt";
    const std::string confFile = "test_engine.conf";
    {
        std::ofstream out(dictFile);
        out << "# names\njohn\nsmith\n";
    }
    {
        std::ofstream out(confFile);
        out << "scanner.accelerated=false\n"
            << "workerThreads=2\n"
            << "dictionary.name=" << dictFile << "\n"
            << "stage.calibration.enabled=false\n";
    }

    EngineConfig cfg;
    phiscan::util::ConfigParser parser(cfg);
    parser.loadFromFile(confFile);

    DetectionEngine engine(cfg);
    EXPECT_EQ(engine.tagger().dictionaryCount(), (size_t)1);
    EXPECT_EQ(engine.scanner().backendName(), "reference");
    EXPECT_FALSE(engine.pipeline().stageConfig("calibration")->enabled);

    auto result = engine.detect("Seen by John Smyth today");
    const Span *smyth = findSpan(result.spans, "NAME", "Smyth");
    ASSERT_NE(smyth, nullptr);
    EXPECT_EQ(smyth->pattern, "FUZZY_NAME_DELETE_1");

    std::remove(dictFile.c_str());
    std::remove(confFile.c_str());
}

TEST(DetectionEngineTest, MissingDictionaryFailsConstruction) {
    EngineConfig cfg = testConfig();
    cfg.dictionaries.push_back({"NAME", "no_such_names_file.txt"});
    EXPECT_THROW(DetectionEngine engine(cfg), std::runtime_error);
}

TEST(DetectionEngineTest, RerankingWithoutEndpointIsDisabled) {
    EngineConfig cfg = testConfig();
    cfg.mlEnabled = true;
    DetectionEngine engine(cfg);
    EXPECT_FALSE(engine.pipeline().hasRanker());
}

TEST(DetectionEngineTest, BatchResultsFollowInputOrder) {
    DetectionEngine engine(testConfig());
    engine.addDictionary("NAME", {"john", "smith"});

    const std::vector<std::string> texts = {
        kNote,
        "No identifiers in this sentence.",
        "Call 555-867-5309 or write to jane.doe@example.org",
    };

    auto batch = engine.detectBatch(texts);
    ASSERT_EQ(batch.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        auto single = engine.detect(texts[i]);
        ASSERT_EQ(batch[i].spans.size(), single.spans.size()) << i;
        EXPECT_EQ(batch[i].patternCandidates, single.patternCandidates);
        for (size_t k = 0; k < single.spans.size(); ++k) {
            EXPECT_EQ(batch[i].spans[k].filterType, single.spans[k].filterType);
            EXPECT_EQ(batch[i].spans[k].characterStart, single.spans[k].characterStart);
            EXPECT_DOUBLE_EQ(batch[i].spans[k].confidence, single.spans[k].confidence);
        }
    }
    EXPECT_TRUE(batch[1].spans.empty());
}

TEST(DetectionEngineTest, AssembledFromComponents) {
    auto scanner = std::make_shared<phiscan::scanner::MultiPatternScanner>(phiscan::scanner::defaultPatterns(), false);
    auto tagger = std::make_shared<phiscan::dictionary::DictionaryTagger>();
    auto pipeline = std::make_shared<phiscan::pipeline::ConfidencePipeline>();

    EXPECT_THROW(DetectionEngine(scanner, nullptr, pipeline), std::runtime_error);

    DetectionEngine engine(scanner, tagger, pipeline, 1);
    auto result = engine.detect("mail a.b@example.com");
    EXPECT_NE(findSpan(result.spans, "EMAIL", "a.b@example.com"), nullptr);
}

} // anonymous namespace
