// test/unit/test_confidence_pipeline.cpp
// -----------------------------------------------------------
// Stage ordering, overrides, failure isolation and run summaries.

#include <algorithm>
#include <cmath>
#include <future>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "pipeline/confidence_pipeline.hpp"
#include "util/thread_pool.hpp"

namespace {

using phiscan::config::StageOverride;
using phiscan::core::RedactionContext;
using phiscan::core::Span;
using namespace phiscan::pipeline;

const std::vector<std::string> kDefaultOrder = {
    "contextModifier", "spanEnhancer", "vectorDisambiguation", "mlConfidenceRanking",
    "crossTypeReasoning", "contextualConfidence", "calibration"};

void enableOnly(ConfidencePipeline &pipeline, const std::string &name)
{
    for (const auto &stage : pipeline.stageNames()) {
        pipeline.setStageEnabled(stage, stage == name);
    }
}

std::vector<Span> overlappingPair()
{
    return {Span("NAME", "a", 10, 20, 0.7), Span("DATE", "b", 15, 25, 0.8)};
}

class FixedRanker : public ConfidenceRanker
{
public:
    std::future<std::vector<Span>> rerank(const std::vector<Span> &spans, const std::string &) override
    {
        std::vector<Span> out = spans;
        for (auto &s : out) {
            s.setConfidence(0.9);
        }
        std::promise<std::vector<Span>> promise;
        promise.set_value(std::move(out));
        return promise.get_future();
    }
    std::string name() const override { return "fixed"; }
};

TEST(ConfidencePipelineTest, DefaultStagesInPriorityOrder) {
    ConfidencePipeline pipeline;
    EXPECT_EQ(pipeline.stageNames(), kDefaultOrder);
    EXPECT_FALSE(pipeline.stageConfig("contextualConfidence")->enabled);
    EXPECT_EQ(pipeline.stageConfig("calibration")->priority, 60);
    EXPECT_FALSE(pipeline.stageConfig("noSuchStage").has_value());
    EXPECT_FALSE(pipeline.hasRanker());
}

TEST(ConfidencePipelineTest, OverridesApplyToDefaultAndLaterStages) {
    std::map<std::string, StageOverride> overrides;
    overrides["calibration"].hasEnabled = true;
    overrides["calibration"].enabled = false;
    overrides["spanEnhancer"].hasPriority = true;
    overrides["spanEnhancer"].priority = 70;
    overrides["custom"].hasPriority = true;
    overrides["custom"].priority = 5;

    ConfidencePipeline pipeline(overrides);
    EXPECT_FALSE(pipeline.stageConfig("calibration")->enabled);
    EXPECT_EQ(pipeline.stageNames().back(), "spanEnhancer");

    pipeline.registerStage({"custom", {true, 99},
        [](std::vector<Span> spans, const std::string &, const RedactionContext &) { return spans; }});
    EXPECT_EQ(pipeline.stageNames().front(), "custom");
}

TEST(ConfidencePipelineTest, EqualPrioritiesKeepRegistrationOrder) {
    ConfidencePipeline pipeline;
    pipeline.registerStage({"afterEnhancer", {true, 20},
        [](std::vector<Span> spans, const std::string &, const RedactionContext &) { return spans; }});

    auto names = pipeline.stageNames();
    auto it = std::find(names.begin(), names.end(), "spanEnhancer");
    ASSERT_NE(it, names.end());
    ASSERT_NE(it + 1, names.end());
    EXPECT_EQ(*(it + 1), "afterEnhancer");
}

TEST(ConfidencePipelineTest, InvalidRegistrationsThrow) {
    ConfidencePipeline pipeline;
    EXPECT_THROW(pipeline.registerStage({"calibration", {true, 1},
                     [](std::vector<Span> spans, const std::string &, const RedactionContext &) { return spans; }}),
                 std::runtime_error);
    EXPECT_THROW(pipeline.registerStage({"empty", {true, 1}, nullptr}), std::runtime_error);
    EXPECT_FALSE(pipeline.setStageEnabled("noSuchStage", true));
}

TEST(ConfidencePipelineTest, SummaryRecordsEveryStage) {
    ConfidencePipeline pipeline;
    EXPECT_FALSE(pipeline.getLastSummary().has_value());

    pipeline.execute(overlappingPair(), std::string(30, 'x'));
    auto summary = pipeline.getLastSummary();
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->totalStages, (size_t)7);
    EXPECT_EQ(summary->enabledStages, (size_t)6);
    EXPECT_EQ(summary->disabledStages, (size_t)1);
    EXPECT_EQ(summary->inputSpanCount, (size_t)2);
    EXPECT_EQ(summary->outputSpanCount, (size_t)2);
    ASSERT_EQ(summary->stageResults.size(), (size_t)7);

    for (size_t i = 0; i < kDefaultOrder.size(); ++i) {
        EXPECT_EQ(summary->stageResults[i].stageName, kDefaultOrder[i]);
    }
    const auto &skipped = summary->stageResults[5];
    EXPECT_FALSE(skipped.enabled);
    EXPECT_EQ(skipped.inputSpans, (size_t)0);
    EXPECT_EQ(skipped.spansModified, (size_t)0);
    EXPECT_DOUBLE_EQ(skipped.executionTimeMs, 0.0);

    size_t modified = 0;
    for (const auto &r : summary->stageResults) {
        modified += r.spansModified;
    }
    EXPECT_EQ(summary->totalSpansModified, modified);
}

TEST(ConfidencePipelineTest, FailingStageIsIsolated) {
    ConfidencePipeline pipeline;
    enableOnly(pipeline, "vectorDisambiguation");
    pipeline.registerStage({"explode", {true, 15},
        [](std::vector<Span>, const std::string &, const RedactionContext &) -> std::vector<Span> {
            throw std::runtime_error("stage exploded");
        }});

    auto out = pipeline.execute(overlappingPair(), "");
    ASSERT_EQ(out.size(), (size_t)2);
    EXPECT_NEAR(out[0].confidence, 0.686, 1e-12);

    auto summary = pipeline.getLastSummary();
    ASSERT_TRUE(summary.has_value());
    const StageResult *failed = nullptr;
    for (const auto &r : summary->stageResults) {
        if (r.stageName == "explode") {
            failed = &r;
        }
    }
    ASSERT_NE(failed, nullptr);
    EXPECT_TRUE(failed->failed);
    EXPECT_EQ(failed->error, "stage exploded");
    EXPECT_EQ(failed->inputSpans, (size_t)2);
    EXPECT_EQ(failed->outputSpans, (size_t)2);
    EXPECT_EQ(failed->spansModified, (size_t)0);
    EXPECT_DOUBLE_EQ(failed->avgConfidenceChange, 0.0);
}

TEST(ConfidencePipelineTest, ConfidenceIsClampedBetweenStages) {
    ConfidencePipeline pipeline;
    enableOnly(pipeline, "");
    pipeline.registerStage({"inflate", {true, 1},
        [](std::vector<Span> spans, const std::string &, const RedactionContext &) {
            for (auto &s : spans) {
                s.confidence = 5.0;
            }
            return spans;
        }});
    pipeline.registerStage({"check", {true, 2},
        [](std::vector<Span> spans, const std::string &, const RedactionContext &) {
            for (const auto &s : spans) {
                if (s.confidence > 1.0) {
                    throw std::runtime_error("unclamped confidence");
                }
            }
            return spans;
        }});

    std::vector<Span> in = {Span("NAME", "a", 0, 1, 0.5)};
    in[0].confidence = -2.0;
    auto out = pipeline.execute(in, "a");

    ASSERT_EQ(out.size(), (size_t)1);
    EXPECT_DOUBLE_EQ(out[0].confidence, 1.0);
    for (const auto &r : pipeline.getLastSummary()->stageResults) {
        EXPECT_FALSE(r.failed) << r.stageName;
    }
}

TEST(ConfidencePipelineTest, CalibrationAloneKeepsMidpoint) {
    ConfidencePipeline pipeline;
    enableOnly(pipeline, "calibration");

    auto out = pipeline.execute({Span("NAME", "a", 0, 1, 0.5), Span("DATE", "b", 2, 3, 0.7)}, "a b");
    EXPECT_DOUBLE_EQ(out[0].confidence, 0.5);

    const double calibrated = 1.0 / (1.0 + std::exp(-2.0));
    EXPECT_NEAR(out[1].confidence, calibrated, 1e-12);

    const auto &result = pipeline.getLastSummary()->stageResults.back();
    EXPECT_EQ(result.stageName, "calibration");
    EXPECT_EQ(result.spansModified, (size_t)1);
    EXPECT_NEAR(result.avgConfidenceChange, (calibrated - 0.7) / 2.0, 1e-12);
}

TEST(ConfidencePipelineTest, RerunningPenalizesOverlapsAgain) {
    ConfidencePipeline pipeline;
    enableOnly(pipeline, "vectorDisambiguation");

    auto once = pipeline.execute(overlappingPair(), "");
    auto twice = pipeline.execute(once, "");

    EXPECT_NEAR(once[0].confidence, 0.686, 1e-12);
    EXPECT_NEAR(twice[0].confidence, 0.686 * 0.98, 1e-12);
    EXPECT_EQ(twice[0].ambiguousWith.size(), (size_t)1);

    ConfidencePipeline full;
    auto first = full.execute(overlappingPair(), std::string(30, 'x'));
    auto second = full.execute(first, std::string(30, 'x'));
    EXPECT_NE(first[0].confidence, second[0].confidence);
}

TEST(ConfidencePipelineTest, RankerIsConsultedForBorderlineSpans) {
    ConfidencePipeline pipeline({}, phiscan::config::getDefaultDetectionParams(), std::make_shared<FixedRanker>());
    EXPECT_TRUE(pipeline.hasRanker());
    enableOnly(pipeline, "mlConfidenceRanking");

    auto out = pipeline.execute({Span("NAME", "a", 0, 1, 0.6), Span("SSN", "b", 2, 3, 0.95)}, "a b");
    EXPECT_DOUBLE_EQ(out[0].confidence, 0.9);
    EXPECT_DOUBLE_EQ(out[1].confidence, 0.95);
}

TEST(ConfidencePipelineTest, ContextReachesCustomStages) {
    ConfidencePipeline pipeline;
    enableOnly(pipeline, "");
    pipeline.registerStage({"documentType", {true, 1},
        [](std::vector<Span> spans, const std::string &, const RedactionContext &ctx) {
            if (ctx.get("type") == "lab") {
                for (auto &s : spans) {
                    s.scaleConfidence(0.5);
                }
            }
            return spans;
        }});

    RedactionContext context;
    context.metadata["type"] = "lab";
    auto out = pipeline.execute({Span("NAME", "a", 0, 1, 0.8)}, "a", context);
    EXPECT_DOUBLE_EQ(out[0].confidence, 0.4);
}

TEST(ConfidencePipelineTest, AsyncMatchesSynchronous) {
    ConfidencePipeline pipeline;
    phiscan::util::ThreadPool pool(2);

    const std::string text = "Patient: John on 01/02/1980";
    auto expected = pipeline.execute(overlappingPair(), text);
    auto actual = pipeline.executeAsync(pool, overlappingPair(), text).get();

    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); ++i) {
        EXPECT_DOUBLE_EQ(actual[i].confidence, expected[i].confidence);
    }
}

} // anonymous namespace
