#ifndef PHISCAN_CONFIG_ENGINE_CONFIG_HPP
#define PHISCAN_CONFIG_ENGINE_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

/**
 * @file engine_config.hpp
 * @brief Settings of one detection engine instance.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp.
 *   - Consumed by core::DetectionEngine, which builds every component from it.
 */

namespace phiscan {
namespace config {

/**
 * @struct StageOverride
 * @brief Per-stage enable flag and priority. Unset fields keep the stage default.
 */
struct StageOverride
{
    bool hasEnabled = false;
    bool enabled = true;
    bool hasPriority = false;
    int priority = 0;
};

/**
 * @struct DictionarySource
 * @brief A dictionary for one category: a .txt path, a .gz path, or
 *        "sqlite:<db>#<table>".
 */
struct DictionarySource
{
    std::string category;
    std::string source;
};

struct EngineConfig
{
    // Logging
    std::string logLevel = "INFO";
    std::string logFile;

    // Backend selection
    bool scannerAccelerated = true;
    bool fuzzyAccelerated = true;

    // Fuzzy dictionaries
    int fuzzyMaxEditDistance = 2;
    std::size_t fuzzyMinTermLength = 3;
    bool fuzzyEnablePhonetic = true;
    std::size_t fuzzyCacheSize = 10000;
    std::vector<DictionarySource> dictionaries;

    // Dictionary tagger
    std::size_t taggerMinTokenLength = 3;
    double taggerMinConfidence = 0.5;

    // Pipeline
    std::map<std::string, StageOverride> stages;

    // Remote re-ranker
    bool mlEnabled = false;
    std::string mlEndpoint;
    long mlTimeoutMs = 250;
    double mlBorderlineMin = 0.4;
    double mlBorderlineMax = 0.8;

    /// 0 means one thread per hardware core.
    std::size_t workerThreads = 0;
};

} // namespace config
} // namespace phiscan

#endif // PHISCAN_CONFIG_ENGINE_CONFIG_HPP
