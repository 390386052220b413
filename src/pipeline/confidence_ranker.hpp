#ifndef PHISCAN_PIPELINE_CONFIDENCE_RANKER_HPP
#define PHISCAN_PIPELINE_CONFIDENCE_RANKER_HPP

#include <future>
#include <string>
#include <vector>

#include "../core/span.hpp"

namespace phiscan {
namespace pipeline {

/**
 * @class ConfidenceRanker
 * @brief External re-ranking model consulted by the mlConfidenceRanking stage.
 *
 * rerank() receives the borderline spans only and must return the same spans,
 * in the same order and with the same offsets and categories; only
 * confidence may differ. The returned future must not block in its
 * destructor (do not hand back a std::async future): the stage abandons it
 * when the timeout expires. Implementations copy whatever they need from the
 * arguments before returning.
 */
class ConfidenceRanker
{
public:
    virtual ~ConfidenceRanker() = default;

    virtual std::future<std::vector<core::Span>> rerank(const std::vector<core::Span> &spans,
                                                        const std::string &text) = 0;

    virtual std::string name() const = 0;
};

/**
 * @struct RerankOptions
 * @brief Borderline band (inclusive) and the longest the stage waits.
 */
struct RerankOptions
{
    double borderlineMin = 0.4;
    double borderlineMax = 0.8;
    long timeoutMs = 250;

    bool isBorderline(double confidence) const
    {
        return confidence >= borderlineMin && confidence <= borderlineMax;
    }
};

} // namespace pipeline
} // namespace phiscan

#endif // PHISCAN_PIPELINE_CONFIDENCE_RANKER_HPP
