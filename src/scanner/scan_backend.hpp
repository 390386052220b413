#ifndef PHISCAN_SCANNER_SCAN_BACKEND_HPP
#define PHISCAN_SCANNER_SCAN_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "pattern_def.hpp"

/**
 * @file scan_backend.hpp
 * @brief Strategy interface for running a whole pattern corpus over a text.
 *
 * Contract shared by every implementation:
 *   - Matches are reported pattern by pattern in corpus order, and within one
 *     pattern in ascending start offset.
 *   - Offsets, text, groups and confidence are exactly what collectMatches()
 *     produces for that pattern.
 *   - An implementation may throw; the scanner then re-runs the document on
 *     the reference backend.
 */

namespace phiscan {
namespace scanner {

class ScanBackend
{
public:
    virtual ~ScanBackend() = default;

    virtual std::vector<ScanMatch> scanAll(const std::string &text) const = 0;

    /// Short name used in logs and statistics ("reference", "hyperscan").
    virtual std::string name() const = 0;
};

/**
 * @class ReferenceScanBackend
 * @brief Runs every pattern's regex over the text, one pattern after another.
 */
class ReferenceScanBackend : public ScanBackend
{
public:
    explicit ReferenceScanBackend(std::shared_ptr<const PatternList> patterns)
        : patterns_(std::move(patterns))
    {
    }

    std::vector<ScanMatch> scanAll(const std::string &text) const override
    {
        std::vector<ScanMatch> matches;
        for (const auto &pattern : *patterns_) {
            collectMatches(pattern, text, matches);
        }
        return matches;
    }

    std::string name() const override { return "reference"; }

private:
    std::shared_ptr<const PatternList> patterns_;
};

/**
 * @brief Build the accelerated backend for a corpus.
 *
 * Returns nullptr when this build carries no accelerated engine. Throws if
 * the engine exists but cannot be prepared for this corpus. Defined in the
 * backend's own translation unit, selected by the build.
 */
std::unique_ptr<ScanBackend> makeAcceleratedScanBackend(std::shared_ptr<const PatternList> patterns);

/// True when this build carries an accelerated scan engine.
bool acceleratedScanCompiledIn();

} // namespace scanner
} // namespace phiscan

#endif // PHISCAN_SCANNER_SCAN_BACKEND_HPP
