#ifndef PHISCAN_CONFIG_DETECTION_PARAMS_HPP
#define PHISCAN_CONFIG_DETECTION_PARAMS_HPP

#include <string>
#include <utility>
#include <vector>

/**
 * @file detection_params.hpp
 * @brief Tunable constants of the confidence pipeline stages.
 *
 * The boost and reduce lists are priority lists: for each span the first
 * entry whose pattern matches the text just before it is the only one applied.
 *
 * Example usage:
 *  @code
 *    auto params = phiscan::config::getDefaultDetectionParams();
 *    params.exclusivePairs.push_back({"NAME", "CITY"});
 *    phiscan::pipeline::ConfidencePipeline pipeline({}, params);
 *  @endcode
 */

namespace phiscan {
namespace config {

/**
 * @struct ContextRule
 * @brief A case-insensitive ECMAScript regex tested against the window of
 *        text preceding a span, and the amount it adds or subtracts.
 */
struct ContextRule
{
    std::string pattern;
    double amount;
};

struct DetectionParams
{
    // contextModifier
    std::size_t contextWindow;
    std::vector<ContextRule> boostRules;
    std::vector<ContextRule> reduceRules;

    // spanEnhancer
    std::vector<std::string> qualityPatternMarkers; // substrings of the lowercased pattern id
    double qualityPatternFactor;
    std::size_t multiWordMinWords;
    double multiWordMinConfidence;
    double multiWordFactor;

    // vectorDisambiguation
    double overlapPenalty;

    // crossTypeReasoning
    std::vector<std::pair<std::string, std::string>> exclusivePairs;
    double exclusiveWinnerFactor;
    double exclusiveLoserFactor;
    double inconsistentTypeFactor;

    // contextualConfidence
    std::vector<std::string> clinicalKeywords;
    double clinicalContextFactor;

    // calibration
    double calibrationSteepness;
    double calibrationMidpoint;
};

inline DetectionParams getDefaultDetectionParams()
{
    DetectionParams p;
    p.contextWindow = 30;
    p.boostRules = {
        {R"(patient\s*:?\s*$)", 0.10},
        {R"(name\s*:?\s*$)",    0.10},
        {R"(dob\s*:?\s*$)",     0.10},
        {R"(ssn\s*:?\s*$)",     0.15},
        {R"(mrn\s*:?\s*$)",     0.10},
    };
    p.reduceRules = {
        {R"(dr\.?\s*$)",         0.05}, // provider names
        {R"(facility\s*:?\s*$)", 0.10},
        {R"(hospital\s*:?\s*$)", 0.10},
    };

    p.qualityPatternMarkers = {"labeled", "explicit"};
    p.qualityPatternFactor = 1.05;
    p.multiWordMinWords = 2;
    p.multiWordMinConfidence = 0.7;
    p.multiWordFactor = 1.02;

    p.overlapPenalty = 0.98;

    p.exclusivePairs = {
        {"DATE", "AGE_90_PLUS"},
        {"SSN", "PHONE"},
        {"MRN", "ZIPCODE"},
    };
    p.exclusiveWinnerFactor = 1.1;
    p.exclusiveLoserFactor = 0.7;
    p.inconsistentTypeFactor = 0.95;

    p.clinicalKeywords = {
        "patient", "diagnosis", "treatment", "medication", "history",
        "admitted", "discharged", "chief complaint", "assessment", "plan",
    };
    p.clinicalContextFactor = 1.03;

    p.calibrationSteepness = 10.0;
    p.calibrationMidpoint = 0.5;
    return p;
}

} // namespace config
} // namespace phiscan

#endif // PHISCAN_CONFIG_DETECTION_PARAMS_HPP
