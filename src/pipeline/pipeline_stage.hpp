#ifndef PHISCAN_PIPELINE_PIPELINE_STAGE_HPP
#define PHISCAN_PIPELINE_PIPELINE_STAGE_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "../core/redaction_context.hpp"
#include "../core/span.hpp"

namespace phiscan {
namespace pipeline {

/**
 * A stage transform receives its own copy of the span list and returns the
 * list handed to the next stage. Throwing leaves the previous list in place.
 */
using StageFunction = std::function<std::vector<core::Span>(std::vector<core::Span>,
                                                            const std::string &,
                                                            const core::RedactionContext &)>;

struct StageConfig
{
    bool enabled = true;
    int priority = 0;
};

struct PipelineStage
{
    std::string name;
    StageConfig config;
    StageFunction execute;
};

/**
 * @struct StageResult
 * @brief What one stage did during the last run. A disabled stage reports
 *        zeros with enabled=false; a failed stage reports equal input and
 *        output counts, zero impact, failed=true and the error text.
 */
struct StageResult
{
    std::string stageName;
    std::size_t inputSpans = 0;
    std::size_t outputSpans = 0;
    std::size_t spansModified = 0;     ///< |delta confidence| > 0.001
    double avgConfidenceChange = 0.0;  ///< Mean |delta| over the input spans
    double executionTimeMs = 0.0;
    bool enabled = true;
    bool failed = false;
    std::string error;
};

struct PipelineSummary
{
    std::size_t totalStages = 0;
    std::size_t enabledStages = 0;
    std::size_t disabledStages = 0;
    double totalTimeMs = 0.0;
    std::vector<StageResult> stageResults;
    std::size_t inputSpanCount = 0;
    std::size_t outputSpanCount = 0;
    std::size_t totalSpansModified = 0;
};

} // namespace pipeline
} // namespace phiscan

#endif // PHISCAN_PIPELINE_PIPELINE_STAGE_HPP
