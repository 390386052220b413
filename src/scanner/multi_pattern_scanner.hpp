#ifndef PHISCAN_SCANNER_MULTI_PATTERN_SCANNER_HPP
#define PHISCAN_SCANNER_MULTI_PATTERN_SCANNER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "default_patterns.hpp"
#include "pattern_def.hpp"
#include "scan_backend.hpp"
#include "../util/logger.hpp"

/**
 * @file multi_pattern_scanner.hpp
 * @brief Runs a pattern corpus over a document and reports raw candidates.
 *
 * DESIGN GOALS:
 *   - One logical pass per document: scan(text) -> {matches, stats}.
 *   - Backend chosen once, at construction. If the accelerated backend
 *     cannot be built, or throws for a document, that document is scanned by
 *     the reference backend instead and the caller sees the same shape.
 *   - Statistics are lock-free atomics. Under concurrent scans the aggregate
 *     counters are approximate but never corrupt.
 *
 * USAGE EXAMPLE:
 *   @code
 *   phiscan::scanner::MultiPatternScanner scanner(phiscan::scanner::defaultPatterns());
 *   auto result = scanner.scan("SSN: 219-09-9999");
 *   for (const auto &m : result.matches) { ... m.filterType, m.start, m.end ... }
 *   @endcode
 */

namespace phiscan {
namespace scanner {

/**
 * @struct ScanStats
 * @brief Per-call statistics.
 */
struct ScanStats
{
    std::size_t textLength = 0;
    std::size_t patternsChecked = 0;
    std::size_t matchesFound = 0;
    double scanTimeMs = 0.0;
};

struct ScanResult
{
    std::vector<ScanMatch> matches;
    ScanStats stats;
};

/**
 * @struct ScannerStats
 * @brief Aggregate statistics since construction or the last resetStats().
 */
struct ScannerStats
{
    PatternStats patterns;
    uint64_t totalScans = 0;
    uint64_t totalMatches = 0;
    double avgTimeMs = 0.0;
    uint64_t referenceScans = 0;
    uint64_t acceleratedScans = 0;
    bool accelerated = false;
    std::string backend;
};

class MultiPatternScanner
{
public:
    /**
     * @param patterns The corpus to run.
     * @param preferAccelerated Try the accelerated backend first.
     */
    explicit MultiPatternScanner(PatternList patterns = defaultPatterns(),
                                 bool preferAccelerated = true)
        : patterns_(std::make_shared<const PatternList>(std::move(patterns))),
          reference_(patterns_)
    {
        indexByType();
        if (preferAccelerated) {
            try {
                accelerated_ = makeAcceleratedScanBackend(patterns_);
            } catch (const std::exception &ex) {
                util::logger::warn(std::string("[MultiPatternScanner] accelerated backend unavailable: ") +
                                   ex.what() + "; using reference backend");
                accelerated_.reset();
            }
        }
        logSelection();
    }

    /**
     * @brief Construct with an explicit accelerated backend (nullptr for
     *        reference only). The backend must have been built for `patterns`.
     */
    MultiPatternScanner(std::shared_ptr<const PatternList> patterns,
                        std::unique_ptr<ScanBackend> accelerated)
        : patterns_(std::move(patterns)),
          reference_(patterns_),
          accelerated_(std::move(accelerated))
    {
        indexByType();
        logSelection();
    }

    MultiPatternScanner(const MultiPatternScanner&) = delete;
    MultiPatternScanner& operator=(const MultiPatternScanner&) = delete;

    /**
     * @brief Scan text against every pattern.
     */
    ScanResult scan(const std::string &text) const
    {
        const auto startTime = std::chrono::steady_clock::now();
        ScanResult result;
        bool usedAccelerated = false;

        if (accelerated_) {
            try {
                result.matches = accelerated_->scanAll(text);
                usedAccelerated = true;
            } catch (const std::exception &ex) {
                util::logger::warn("[MultiPatternScanner] " + accelerated_->name() +
                                   " backend failed (" + ex.what() + "); rescanning with reference");
                result.matches.clear();
            }
        }
        if (!usedAccelerated) {
            result.matches = reference_.scanAll(text);
        }

        result.stats.textLength = text.size();
        result.stats.patternsChecked = patterns_->size();
        result.stats.matchesFound = result.matches.size();
        result.stats.scanTimeMs = elapsedMs(startTime);

        record(result.stats, usedAccelerated);
        return result;
    }

    /**
     * @brief Scan with only the patterns of the given categories, in the order
     *        the categories are listed. Unknown categories are ignored.
     *        Always runs on the reference backend.
     */
    ScanResult scanForTypes(const std::string &text, const std::vector<std::string> &types) const
    {
        const auto startTime = std::chrono::steady_clock::now();
        ScanResult result;

        for (const auto &type : types) {
            auto it = patternsByType_.find(type);
            if (it == patternsByType_.end()) {
                continue;
            }
            for (std::size_t index : it->second) {
                collectMatches((*patterns_)[index], text, result.matches);
                ++result.stats.patternsChecked;
            }
        }

        result.stats.textLength = text.size();
        result.stats.matchesFound = result.matches.size();
        result.stats.scanTimeMs = elapsedMs(startTime);

        record(result.stats, false);
        return result;
    }

    bool isAccelerated() const { return static_cast<bool>(accelerated_); }

    std::string backendName() const
    {
        return accelerated_ ? accelerated_->name() : reference_.name();
    }

    const PatternList &patterns() const { return *patterns_; }

    ScannerStats getStats() const
    {
        ScannerStats s;
        s.patterns = patternStats(*patterns_);
        s.totalScans = totalScans_.load(std::memory_order_relaxed);
        s.totalMatches = totalMatches_.load(std::memory_order_relaxed);
        const uint64_t nanos = totalNanos_.load(std::memory_order_relaxed);
        s.avgTimeMs = s.totalScans > 0 ? (static_cast<double>(nanos) / 1e6) / static_cast<double>(s.totalScans) : 0.0;
        s.referenceScans = referenceScans_.load(std::memory_order_relaxed);
        s.acceleratedScans = acceleratedScans_.load(std::memory_order_relaxed);
        s.accelerated = isAccelerated();
        s.backend = backendName();
        return s;
    }

    void resetStats()
    {
        totalScans_ = 0;
        totalMatches_ = 0;
        totalNanos_ = 0;
        referenceScans_ = 0;
        acceleratedScans_ = 0;
    }

private:
    static double elapsedMs(std::chrono::steady_clock::time_point start)
    {
        const auto elapsed = std::chrono::steady_clock::now() - start;
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

    void indexByType()
    {
        for (std::size_t i = 0; i < patterns_->size(); ++i) {
            patternsByType_[(*patterns_)[i].filterType()].push_back(i);
        }
    }

    void logSelection() const
    {
        util::logger::info("[MultiPatternScanner] " + std::to_string(patterns_->size()) +
                           " patterns, backend=" + backendName());
    }

    void record(const ScanStats &stats, bool accelerated) const
    {
        totalScans_.fetch_add(1, std::memory_order_relaxed);
        totalMatches_.fetch_add(stats.matchesFound, std::memory_order_relaxed);
        totalNanos_.fetch_add(static_cast<uint64_t>(stats.scanTimeMs * 1e6), std::memory_order_relaxed);
        if (accelerated) {
            acceleratedScans_.fetch_add(1, std::memory_order_relaxed);
        } else {
            referenceScans_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::shared_ptr<const PatternList> patterns_;
    std::map<std::string, std::vector<std::size_t>> patternsByType_;
    ReferenceScanBackend reference_;
    std::unique_ptr<ScanBackend> accelerated_;

    mutable std::atomic<uint64_t> totalScans_{0};
    mutable std::atomic<uint64_t> totalMatches_{0};
    mutable std::atomic<uint64_t> totalNanos_{0};
    mutable std::atomic<uint64_t> referenceScans_{0};
    mutable std::atomic<uint64_t> acceleratedScans_{0};
};

} // namespace scanner
} // namespace phiscan

#endif // PHISCAN_SCANNER_MULTI_PATTERN_SCANNER_HPP
