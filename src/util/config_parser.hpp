#ifndef PHISCAN_UTIL_CONFIG_PARSER_HPP
#define PHISCAN_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <istream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

#include "engine_config.hpp"
#include "logger.hpp"
#include "text_utils.hpp"

/**
 * @file config_parser.hpp
 * @brief Parses a key=value configuration file into phiscan::config::EngineConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - '#' starts a comment line; whitespace around keys and values is trimmed.
 *   - Unknown keys are logged and ignored. Malformed lines and bad values throw.
 *
 * USAGE:
 *   @code
 *   phiscan::config::EngineConfig engineConfig;
 *   phiscan::util::ConfigParser parser(engineConfig);
 *   parser.loadFromFile("phiscan.conf");
 *   @endcode
 *
 * Recognized keys:
 *   logLevel, logFile, workerThreads
 *   scanner.accelerated, fuzzy.accelerated
 *   fuzzy.maxEditDistance, fuzzy.minTermLength, fuzzy.enablePhonetic, fuzzy.cacheSize
 *   dictionary.<CATEGORY>=<source>          (repeatable)
 *   tagger.minTokenLength, tagger.minConfidence
 *   stage.<name>.enabled, stage.<name>.priority
 *   ml.enabled, ml.endpoint, ml.timeoutMs, ml.borderlineMin, ml.borderlineMax
 */

namespace phiscan {
namespace util {

/**
 * @class ConfigParser
 * @brief Minimal parser that reads a plain text key=value config, updates EngineConfig fields.
 */
class ConfigParser
{
public:
    /**
     * @brief Construct a new ConfigParser object, referencing an EngineConfig to populate.
     */
    explicit ConfigParser(phiscan::config::EngineConfig &engineConfig)
        : engineConfig_(engineConfig)
    {
    }

    /**
     * @brief Read the given file and apply every recognized key.
     *        A missing file is logged and leaves the defaults in place.
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath);
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
    }

    void loadFromString(const std::string &content)
    {
        std::istringstream in(content);
        loadFromStream(in);
    }

    void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line (no '='): " + line);
            }
            std::string key = trim(line.substr(0, pos));
            std::string val = trim(line.substr(pos + 1));
            if (key.empty()) {
                throw std::runtime_error("ConfigParser: invalid line (empty key): " + line);
            }

            applyKeyValue(key, val);
        }
    }

private:
    phiscan::config::EngineConfig &engineConfig_;
    std::mutex mutex_;

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        auto &cfg = engineConfig_;

        if (key == "logLevel") {
            logger::parseLogLevel(val); // validate
            cfg.logLevel = val;
        }
        else if (key == "logFile") {
            cfg.logFile = val;
        }
        else if (key == "workerThreads") {
            cfg.workerThreads = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "scanner.accelerated") {
            cfg.scannerAccelerated = parseBool(val);
        }
        else if (key == "fuzzy.accelerated") {
            cfg.fuzzyAccelerated = parseBool(val);
        }
        else if (key == "fuzzy.maxEditDistance") {
            const uint64_t distance = parseUInt(val);
            if (distance > 2) {
                throw std::runtime_error("ConfigParser: fuzzy.maxEditDistance must be 0, 1 or 2, got " + val);
            }
            cfg.fuzzyMaxEditDistance = static_cast<int>(distance);
        }
        else if (key == "fuzzy.minTermLength") {
            cfg.fuzzyMinTermLength = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "fuzzy.enablePhonetic") {
            cfg.fuzzyEnablePhonetic = parseBool(val);
        }
        else if (key == "fuzzy.cacheSize") {
            cfg.fuzzyCacheSize = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key.rfind("dictionary.", 0) == 0) {
            const std::string category = toUpper(key.substr(std::string("dictionary.").size()));
            if (category.empty() || val.empty()) {
                throw std::runtime_error("ConfigParser: dictionary entry needs a category and a source: " + key);
            }
            cfg.dictionaries.push_back({category, val});
        }
        else if (key == "tagger.minTokenLength") {
            cfg.taggerMinTokenLength = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "tagger.minConfidence") {
            cfg.taggerMinConfidence = parseUnitDouble(key, val);
        }
        else if (key.rfind("stage.", 0) == 0) {
            applyStageKey(key, val);
        }
        else if (key == "ml.enabled") {
            cfg.mlEnabled = parseBool(val);
        }
        else if (key == "ml.endpoint") {
            cfg.mlEndpoint = val;
        }
        else if (key == "ml.timeoutMs") {
            cfg.mlTimeoutMs = static_cast<long>(parseUInt(val));
        }
        else if (key == "ml.borderlineMin") {
            cfg.mlBorderlineMin = parseUnitDouble(key, val);
        }
        else if (key == "ml.borderlineMax") {
            cfg.mlBorderlineMax = parseUnitDouble(key, val);
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }

        logger::debug("ConfigParser: " + key + " set to " + val);
    }

    // stage.<name>.enabled / stage.<name>.priority
    void applyStageKey(const std::string &key, const std::string &val)
    {
        const std::string rest = key.substr(std::string("stage.").size());
        const auto dot = rest.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            throw std::runtime_error("ConfigParser: invalid stage key: " + key);
        }
        const std::string name = rest.substr(0, dot);
        const std::string field = rest.substr(dot + 1);

        auto &entry = engineConfig_.stages[name];
        if (field == "enabled") {
            entry.hasEnabled = true;
            entry.enabled = parseBool(val);
        }
        else if (field == "priority") {
            entry.hasPriority = true;
            entry.priority = parseInt(val);
        }
        else {
            throw std::runtime_error("ConfigParser: unknown stage field '" + field + "' in " + key);
        }
    }

    uint64_t parseUInt(const std::string &val) const
    {
        try {
            if (!val.empty() && val[0] == '-') {
                throw std::runtime_error("negative value");
            }
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    int parseInt(const std::string &val) const
    {
        try {
            size_t idx = 0;
            int n = std::stoi(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseInt failed on '" + val + "': " + ex.what());
        }
    }

    double parseUnitDouble(const std::string &key, const std::string &val) const
    {
        double d = 0.0;
        try {
            size_t idx = 0;
            d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseDouble failed on '" + val + "': " + ex.what());
        }
        if (!(d >= 0.0 && d <= 1.0)) {
            throw std::runtime_error("ConfigParser: " + key + " must be within [0,1], got " + val);
        }
        return d;
    }

    bool parseBool(const std::string &val) const
    {
        const std::string v = toLower(val);
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        throw std::runtime_error("ConfigParser: parseBool failed on '" + val + "'");
    }
};

} // namespace util
} // namespace phiscan

#endif // PHISCAN_UTIL_CONFIG_PARSER_HPP
