#ifndef PHISCAN_PIPELINE_CONFIDENCE_PIPELINE_HPP
#define PHISCAN_PIPELINE_CONFIDENCE_PIPELINE_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "confidence_ranker.hpp"
#include "confidence_stages.hpp"
#include "detection_params.hpp"
#include "engine_config.hpp"
#include "pipeline_stage.hpp"
#include "../core/redaction_context.hpp"
#include "../core/span.hpp"
#include "../util/logger.hpp"
#include "../util/thread_pool.hpp"

/**
 * @file confidence_pipeline.hpp
 * @brief Ordered, individually switchable stages that rescore candidate spans.
 *
 * DESIGN GOALS:
 *   - Stages run one after another in ascending priority; equal priorities
 *     keep registration order.
 *   - Every stage appears in the run summary. Disabled stages are recorded as
 *     skipped; a throwing stage is recorded as failed with zero impact and the
 *     spans it was given flow on to the next stage unchanged.
 *   - Confidences are clamped to [0,1] after every stage.
 *   - execute() may be called concurrently; the stage list is read under a
 *     shared lock and each run works on its own span vector.
 *
 * Default stages and priorities:
 *   contextModifier 10, spanEnhancer 20, vectorDisambiguation 30,
 *   mlConfidenceRanking 35, crossTypeReasoning 40,
 *   contextualConfidence 50 (disabled), calibration 60.
 */

namespace phiscan {
namespace pipeline {

class ConfidencePipeline
{
public:
    /**
     * @param overrides Per-stage enabled/priority overrides, by stage name.
     *        They also apply to stages registered later under that name.
     * @param params Stage constants.
     * @param ranker Optional external re-ranker for mlConfidenceRanking.
     * @param rerankOptions Borderline band and timeout for the re-ranker.
     * @throw std::runtime_error if a context rule does not compile.
     */
    explicit ConfidencePipeline(std::map<std::string, config::StageOverride> overrides = {},
                                config::DetectionParams params = config::getDefaultDetectionParams(),
                                std::shared_ptr<ConfidenceRanker> ranker = nullptr,
                                RerankOptions rerankOptions = RerankOptions())
        : overrides_(std::move(overrides)),
          params_(std::make_shared<const config::DetectionParams>(std::move(params))),
          ranker_(std::move(ranker)),
          rerankOptions_(rerankOptions)
    {
        registerDefaultStages();
    }

    ConfidencePipeline(const ConfidencePipeline&) = delete;
    ConfidencePipeline& operator=(const ConfidencePipeline&) = delete;

    /**
     * @brief Add a stage and re-sort. Overrides for its name are applied.
     * @throw std::runtime_error on a duplicate name or an empty transform.
     */
    void registerStage(PipelineStage stage)
    {
        if (!stage.execute) {
            throw std::runtime_error("ConfidencePipeline: stage '" + stage.name + "' has no transform");
        }
        applyOverride(stage);

        std::unique_lock<std::shared_mutex> lock(stagesMutex_);
        for (const auto &existing : stages_) {
            if (existing.name == stage.name) {
                throw std::runtime_error("ConfidencePipeline: duplicate stage '" + stage.name + "'");
            }
        }
        stages_.push_back(std::move(stage));
        std::stable_sort(stages_.begin(), stages_.end(), [](const PipelineStage &a, const PipelineStage &b) {
            return a.config.priority < b.config.priority;
        });
    }

    /// @return false if no stage has that name.
    bool setStageEnabled(const std::string &name, bool enabled)
    {
        std::unique_lock<std::shared_mutex> lock(stagesMutex_);
        for (auto &stage : stages_) {
            if (stage.name == name) {
                stage.config.enabled = enabled;
                return true;
            }
        }
        util::logger::warn("[ConfidencePipeline] setStageEnabled: no stage named '" + name + "'");
        return false;
    }

    /// Stage names in execution order.
    std::vector<std::string> stageNames() const
    {
        std::shared_lock<std::shared_mutex> lock(stagesMutex_);
        std::vector<std::string> names;
        for (const auto &stage : stages_) {
            names.push_back(stage.name);
        }
        return names;
    }

    std::optional<StageConfig> stageConfig(const std::string &name) const
    {
        std::shared_lock<std::shared_mutex> lock(stagesMutex_);
        for (const auto &stage : stages_) {
            if (stage.name == name) {
                return stage.config;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Run every stage over the spans and record a summary.
     */
    std::vector<core::Span> execute(std::vector<core::Span> spans, const std::string &text,
                                    const core::RedactionContext &context = core::RedactionContext())
    {
        const auto pipelineStart = std::chrono::steady_clock::now();

        std::vector<PipelineStage> stages;
        {
            std::shared_lock<std::shared_mutex> lock(stagesMutex_);
            stages = stages_;
        }

        PipelineSummary summary;
        summary.totalStages = stages.size();
        summary.inputSpanCount = spans.size();

        std::vector<core::Span> current = std::move(spans);
        for (auto &span : current) {
            span.setConfidence(span.confidence);
        }

        for (const auto &stage : stages) {
            StageResult result;
            result.stageName = stage.name;

            if (!stage.config.enabled) {
                result.enabled = false;
                summary.stageResults.push_back(result);
                ++summary.disabledStages;
                continue;
            }
            ++summary.enabledStages;

            const auto stageStart = std::chrono::steady_clock::now();
            result.inputSpans = current.size();

            try {
                std::vector<core::Span> output = stage.execute(current, text, context);
                for (auto &span : output) {
                    span.setConfidence(span.confidence);
                }
                measureImpact(current, output, result);
                current = std::move(output);

                util::logger::debug("[ConfidencePipeline] " + stage.name + " modified " +
                                    std::to_string(result.spansModified) + " of " +
                                    std::to_string(result.inputSpans) + " spans");
            } catch (const std::exception &ex) {
                result.outputSpans = current.size();
                result.spansModified = 0;
                result.avgConfidenceChange = 0.0;
                result.failed = true;
                result.error = ex.what();
                util::logger::error("[ConfidencePipeline] stage " + stage.name + " failed: " + ex.what());
            }

            result.executionTimeMs = elapsedMs(stageStart);
            summary.totalSpansModified += result.spansModified;
            summary.stageResults.push_back(result);
        }

        summary.outputSpanCount = current.size();
        summary.totalTimeMs = elapsedMs(pipelineStart);
        {
            std::lock_guard<std::mutex> lock(summaryMutex_);
            lastSummary_ = std::move(summary);
        }
        return current;
    }

    /**
     * @brief execute() on a worker thread. The pipeline must outlive the future.
     */
    std::future<std::vector<core::Span>> executeAsync(util::ThreadPool &pool, std::vector<core::Span> spans,
                                                      std::string text,
                                                      core::RedactionContext context = core::RedactionContext())
    {
        return pool.enqueue([this, spans = std::move(spans), text = std::move(text),
                             context = std::move(context)]() mutable {
            return execute(std::move(spans), text, context);
        });
    }

    /// Summary of the most recent execute(), if any.
    std::optional<PipelineSummary> getLastSummary() const
    {
        std::lock_guard<std::mutex> lock(summaryMutex_);
        return lastSummary_;
    }

    const config::DetectionParams &params() const { return *params_; }

    bool hasRanker() const { return static_cast<bool>(ranker_); }

private:
    static double elapsedMs(std::chrono::steady_clock::time_point start)
    {
        const auto elapsed = std::chrono::steady_clock::now() - start;
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

    // Deltas are index aligned; input spans without a counterpart count as unchanged.
    static void measureImpact(const std::vector<core::Span> &before, const std::vector<core::Span> &after,
                              StageResult &result)
    {
        result.outputSpans = after.size();
        double totalChange = 0.0;
        const std::size_t common = std::min(before.size(), after.size());
        for (std::size_t i = 0; i < common; ++i) {
            const double change = std::fabs(after[i].confidence - before[i].confidence);
            totalChange += change;
            if (change > 0.001) {
                ++result.spansModified;
            }
        }
        result.avgConfidenceChange = before.empty() ? 0.0 : totalChange / static_cast<double>(before.size());
    }

    void applyOverride(PipelineStage &stage) const
    {
        auto it = overrides_.find(stage.name);
        if (it == overrides_.end()) {
            return;
        }
        if (it->second.hasEnabled) {
            stage.config.enabled = it->second.enabled;
        }
        if (it->second.hasPriority) {
            stage.config.priority = it->second.priority;
        }
    }

    void registerDefaultStages()
    {
        auto params = params_;
        auto rules = std::make_shared<const stages::CompiledContextRules>(
            stages::CompiledContextRules::compile(*params));

        registerStage({"contextModifier", {true, 10},
            [rules](std::vector<core::Span> spans, const std::string &text, const core::RedactionContext &) {
                return stages::contextModifier(std::move(spans), text, *rules);
            }});

        registerStage({"spanEnhancer", {true, 20},
            [params](std::vector<core::Span> spans, const std::string &, const core::RedactionContext &) {
                return stages::spanEnhancer(std::move(spans), *params);
            }});

        registerStage({"vectorDisambiguation", {true, 30},
            [params](std::vector<core::Span> spans, const std::string &, const core::RedactionContext &) {
                return stages::vectorDisambiguation(std::move(spans), params->overlapPenalty);
            }});

        auto ranker = ranker_;
        const RerankOptions options = rerankOptions_;
        registerStage({"mlConfidenceRanking", {true, 35},
            [ranker, options](std::vector<core::Span> spans, const std::string &text, const core::RedactionContext &) {
                return stages::mlConfidenceRanking(std::move(spans), text, ranker.get(), options);
            }});

        registerStage({"crossTypeReasoning", {true, 40},
            [params](std::vector<core::Span> spans, const std::string &, const core::RedactionContext &) {
                return stages::crossTypeReasoning(std::move(spans), *params);
            }});

        registerStage({"contextualConfidence", {false, 50},
            [params](std::vector<core::Span> spans, const std::string &text, const core::RedactionContext &) {
                return stages::contextualConfidence(std::move(spans), text, *params);
            }});

        registerStage({"calibration", {true, 60},
            [params](std::vector<core::Span> spans, const std::string &, const core::RedactionContext &) {
                return stages::calibration(std::move(spans), *params);
            }});
    }

    std::map<std::string, config::StageOverride> overrides_;
    std::shared_ptr<const config::DetectionParams> params_;
    std::shared_ptr<ConfidenceRanker> ranker_;
    RerankOptions rerankOptions_;

    mutable std::shared_mutex stagesMutex_;
    std::vector<PipelineStage> stages_;

    mutable std::mutex summaryMutex_;
    std::optional<PipelineSummary> lastSummary_;
};

} // namespace pipeline
} // namespace phiscan

#endif // PHISCAN_PIPELINE_CONFIDENCE_PIPELINE_HPP
