#ifndef PHISCAN_PIPELINE_CONFIDENCE_STAGES_HPP
#define PHISCAN_PIPELINE_CONFIDENCE_STAGES_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <numeric>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "confidence_ranker.hpp"
#include "detection_params.hpp"
#include "../core/span.hpp"
#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

/**
 * @file confidence_stages.hpp
 * @brief The built-in confidence pipeline stages.
 *
 * Each stage is a plain function over a span vector. The pipeline wires
 * them up with their parameters in ConfidencePipeline::registerDefaultStages().
 * Confidence is clamped by the multiplying helpers of core::Span; the
 * pipeline clamps once more after every stage.
 */

namespace phiscan {
namespace pipeline {
namespace stages {

/**
 * @struct CompiledContextRules
 * @brief contextModifier rules with their regexes compiled once.
 */
struct CompiledContextRules
{
    struct Rule
    {
        std::regex pattern;
        double amount;
    };

    std::size_t window = 30;
    std::vector<Rule> boost;
    std::vector<Rule> reduce;

    /// @throw std::runtime_error if a rule does not compile.
    static CompiledContextRules compile(const config::DetectionParams &params)
    {
        CompiledContextRules rules;
        rules.window = params.contextWindow;
        for (const auto &r : params.boostRules) {
            rules.boost.push_back({compileRule(r.pattern), r.amount});
        }
        for (const auto &r : params.reduceRules) {
            rules.reduce.push_back({compileRule(r.pattern), r.amount});
        }
        return rules;
    }

private:
    static std::regex compileRule(const std::string &pattern)
    {
        try {
            return std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
        } catch (const std::regex_error &ex) {
            throw std::runtime_error("ConfidencePipeline: context rule '" + pattern +
                                     "' failed to compile: " + ex.what());
        }
    }
};

/**
 * @brief Adjust confidence by the text just before each span: the first
 *        matching boost rule adds, then independently the first matching
 *        reduce rule subtracts.
 */
inline std::vector<core::Span> contextModifier(std::vector<core::Span> spans, const std::string &text,
                                               const CompiledContextRules &rules)
{
    for (auto &span : spans) {
        const std::size_t end = std::min(span.characterStart, text.size());
        const std::size_t begin = end > rules.window ? end - rules.window : 0;
        const std::string before = text.substr(begin, end - begin);

        for (const auto &rule : rules.boost) {
            if (std::regex_search(before, rule.pattern)) {
                span.setConfidence(span.confidence + rule.amount);
                break;
            }
        }
        for (const auto &rule : rules.reduce) {
            if (std::regex_search(before, rule.pattern)) {
                span.setConfidence(span.confidence - rule.amount);
                break;
            }
        }
    }
    return spans;
}

inline std::vector<core::Span> spanEnhancer(std::vector<core::Span> spans, const config::DetectionParams &params)
{
    for (auto &span : spans) {
        if (!span.pattern.empty()) {
            const std::string patternId = util::toLower(span.pattern);
            for (const auto &marker : params.qualityPatternMarkers) {
                if (patternId.find(marker) != std::string::npos) {
                    span.scaleConfidence(params.qualityPatternFactor);
                    break;
                }
            }
        }

        if (util::countWords(span.text) >= params.multiWordMinWords &&
            span.confidence >= params.multiWordMinConfidence) {
            span.scaleConfidence(params.multiWordFactor);
        }
    }
    return spans;
}

/**
 * @brief Mark overlapping spans as ambiguous with each other and penalize
 *        both, once per overlapping pair. Output keeps the input order.
 *
 * Running this again on its own output penalizes still-overlapping spans
 * again; there is no fixed point.
 */
inline std::vector<core::Span> vectorDisambiguation(std::vector<core::Span> spans, double overlapPenalty)
{
    std::vector<std::size_t> order(spans.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&spans](std::size_t a, std::size_t b) {
        return spans[a].characterStart < spans[b].characterStart;
    });

    for (std::size_t i = 0; i < order.size(); ++i) {
        core::Span &current = spans[order[i]];
        for (std::size_t j = i + 1; j < order.size(); ++j) {
            core::Span &next = spans[order[j]];
            if (next.characterStart >= current.characterEnd) {
                break;
            }
            current.addAmbiguity(next.filterType);
            next.addAmbiguity(current.filterType);
            current.scaleConfidence(overlapPenalty);
            next.scaleConfidence(overlapPenalty);
        }
    }
    return spans;
}

/**
 * @brief Hand borderline spans to the external ranker and take back their
 *        confidences. A missing ranker, a timeout, an error or a reply that
 *        changes span identity leaves every span as it was.
 */
inline std::vector<core::Span> mlConfidenceRanking(std::vector<core::Span> spans, const std::string &text,
                                                   ConfidenceRanker *ranker, const RerankOptions &options)
{
    if (ranker == nullptr) {
        return spans;
    }

    std::vector<std::size_t> indices;
    std::vector<core::Span> borderline;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        if (options.isBorderline(spans[i].confidence)) {
            indices.push_back(i);
            borderline.push_back(spans[i]);
        }
    }
    if (borderline.empty()) {
        return spans;
    }

    std::vector<core::Span> reranked;
    try {
        std::future<std::vector<core::Span>> pending = ranker->rerank(borderline, text);
        if (!pending.valid()) {
            util::logger::warn("[mlConfidenceRanking] " + ranker->name() + " returned no result; skipping");
            return spans;
        }
        if (pending.wait_for(std::chrono::milliseconds(options.timeoutMs)) != std::future_status::ready) {
            util::logger::warn("[mlConfidenceRanking] " + ranker->name() + " timed out after " +
                               std::to_string(options.timeoutMs) + " ms; skipping");
            return spans;
        }
        reranked = pending.get();
    } catch (const std::exception &ex) {
        util::logger::warn("[mlConfidenceRanking] " + ranker->name() + " failed: " + ex.what() + "; skipping");
        return spans;
    }

    if (reranked.size() != borderline.size()) {
        util::logger::warn("[mlConfidenceRanking] " + ranker->name() + " returned " +
                           std::to_string(reranked.size()) + " spans for " +
                           std::to_string(borderline.size()) + "; skipping");
        return spans;
    }
    for (std::size_t k = 0; k < reranked.size(); ++k) {
        if (!reranked[k].sameOffsets(borderline[k]) || reranked[k].filterType != borderline[k].filterType) {
            util::logger::warn("[mlConfidenceRanking] " + ranker->name() + " changed span identity; skipping");
            return spans;
        }
    }

    for (std::size_t k = 0; k < reranked.size(); ++k) {
        spans[indices[k]].setConfidence(reranked[k].confidence);
    }
    return spans;
}

/**
 * @brief Mutual exclusion for same-offset spans of configured category
 *        pairs, then a penalty for text already seen under another category.
 *
 * On a confidence tie the first category of the pair wins. A span that sits
 * in several configured pairs is adjusted once per pair.
 */
inline std::vector<core::Span> crossTypeReasoning(std::vector<core::Span> spans,
                                                  const config::DetectionParams &params)
{
    std::map<std::string, std::vector<std::size_t>> byType;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        byType[spans[i].filterType].push_back(i);
    }

    for (const auto &pair : params.exclusivePairs) {
        auto first = byType.find(pair.first);
        auto second = byType.find(pair.second);
        if (first == byType.end() || second == byType.end()) {
            continue;
        }
        for (std::size_t a : first->second) {
            for (std::size_t b : second->second) {
                core::Span &s1 = spans[a];
                core::Span &s2 = spans[b];
                if (!s1.sameOffsets(s2)) {
                    continue;
                }
                if (s1.confidence >= s2.confidence) {
                    s1.scaleConfidence(params.exclusiveWinnerFactor);
                    s2.scaleConfidence(params.exclusiveLoserFactor);
                } else {
                    s2.scaleConfidence(params.exclusiveWinnerFactor);
                    s1.scaleConfidence(params.exclusiveLoserFactor);
                }
            }
        }
    }

    std::map<std::string, std::string> firstCategory;
    for (auto &span : spans) {
        const std::string key = util::toLower(span.text);
        auto it = firstCategory.find(key);
        if (it == firstCategory.end()) {
            firstCategory.emplace(key, span.filterType);
        } else if (it->second != span.filterType) {
            span.scaleConfidence(params.inconsistentTypeFactor);
        }
    }
    return spans;
}

inline std::vector<core::Span> contextualConfidence(std::vector<core::Span> spans, const std::string &text,
                                                    const config::DetectionParams &params)
{
    const std::string lower = util::toLower(text);
    const bool clinical = std::any_of(params.clinicalKeywords.begin(), params.clinicalKeywords.end(),
                                      [&lower](const std::string &keyword) {
                                          return lower.find(util::toLower(keyword)) != std::string::npos;
                                      });
    if (clinical) {
        for (auto &span : spans) {
            span.scaleConfidence(params.clinicalContextFactor);
        }
    }
    return spans;
}

/**
 * @brief Logistic sharpening: 1 / (1 + exp(-steepness * (x - midpoint))).
 */
inline double calibrate(double confidence, double steepness, double midpoint)
{
    return 1.0 / (1.0 + std::exp(-steepness * (confidence - midpoint)));
}

inline std::vector<core::Span> calibration(std::vector<core::Span> spans, const config::DetectionParams &params)
{
    for (auto &span : spans) {
        span.setConfidence(calibrate(span.confidence, params.calibrationSteepness, params.calibrationMidpoint));
    }
    return spans;
}

} // namespace stages
} // namespace pipeline
} // namespace phiscan

#endif // PHISCAN_PIPELINE_CONFIDENCE_STAGES_HPP
