#include <hs/hs.h>

#include <climits>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "scan_backend.hpp"
#include "../util/logger.hpp"

/*
  HyperscanScanBackend
  --------------------------------------------------------
  Accelerated scan path. All patterns are compiled into one Hyperscan
  block-mode database in prefilter mode, so a single pass over the text tells
  us which patterns can possibly match. Only those patterns are then run
  through collectMatches(), which is exactly what the reference backend does
  for every pattern. Prefilter mode never produces false negatives, so the
  output is identical to the reference output; the saving is every pattern
  that cannot match.

  Patterns Hyperscan rejects even in prefilter mode are kept aside and always
  confirmed, so a corpus never loses coverage by going through this path.
*/

namespace phiscan {
namespace scanner {

namespace {

struct DatabaseDeleter {
    void operator()(hs_database_t *db) const { hs_free_database(db); }
};

struct ScratchDeleter {
    void operator()(hs_scratch_t *scratch) const { hs_free_scratch(scratch); }
};

using DatabasePtr = std::unique_ptr<hs_database_t, DatabaseDeleter>;
using ScratchPtr = std::unique_ptr<hs_scratch_t, ScratchDeleter>;

int onPrefilterHit(unsigned int id, unsigned long long /*from*/, unsigned long long /*to*/,
                   unsigned int /*flags*/, void *context)
{
    auto *hits = static_cast<std::vector<char> *>(context);
    if (id < hits->size()) {
        (*hits)[id] = 1;
    }
    return 0;
}

class HyperscanScanBackend : public ScanBackend
{
public:
    explicit HyperscanScanBackend(std::shared_ptr<const PatternList> patterns)
        : patterns_(std::move(patterns)),
          alwaysConfirm_(patterns_->size(), 0)
    {
        compileDatabase();
    }

    std::vector<ScanMatch> scanAll(const std::string &text) const override
    {
        if (text.size() > UINT_MAX) {
            throw std::runtime_error("HyperscanScanBackend: text exceeds block scan limit");
        }

        std::vector<char> hits(alwaysConfirm_);
        if (database_) {
            hs_scratch_t *raw = nullptr;
            if (hs_clone_scratch(scratchPrototype_.get(), &raw) != HS_SUCCESS) {
                throw std::runtime_error("HyperscanScanBackend: hs_clone_scratch failed");
            }
            ScratchPtr scratch(raw);

            hs_error_t rc = hs_scan(database_.get(), text.data(),
                                    static_cast<unsigned int>(text.size()), 0,
                                    scratch.get(), onPrefilterHit, &hits);
            if (rc != HS_SUCCESS) {
                throw std::runtime_error("HyperscanScanBackend: hs_scan failed with code " +
                                         std::to_string(rc));
            }
        }

        std::vector<ScanMatch> matches;
        for (std::size_t i = 0; i < patterns_->size(); ++i) {
            if (hits[i]) {
                collectMatches((*patterns_)[i], text, matches);
            }
        }
        return matches;
    }

    std::string name() const override { return "hyperscan"; }

private:
    void compileDatabase()
    {
        std::vector<unsigned int> candidates;
        for (unsigned int i = 0; i < patterns_->size(); ++i) {
            candidates.push_back(i);
        }

        // Drop any expression Hyperscan rejects and retry with the rest.
        while (!candidates.empty()) {
            std::vector<const char *> expressions;
            std::vector<unsigned int> flags;
            for (unsigned int id : candidates) {
                const PatternDef &p = (*patterns_)[id];
                expressions.push_back(p.expression().c_str());
                unsigned int f = HS_FLAG_PREFILTER | HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY;
                if (p.caseInsensitive()) {
                    f |= HS_FLAG_CASELESS;
                }
                flags.push_back(f);
            }

            hs_database_t *db = nullptr;
            hs_compile_error_t *compileError = nullptr;
            hs_error_t rc = hs_compile_multi(expressions.data(), flags.data(), candidates.data(),
                                             static_cast<unsigned int>(candidates.size()),
                                             HS_MODE_BLOCK, nullptr, &db, &compileError);
            if (rc == HS_SUCCESS) {
                database_.reset(db);
                break;
            }

            const int failedIndex = compileError ? compileError->expression : -1;
            const std::string message = compileError && compileError->message
                                            ? compileError->message : "unknown error";
            hs_free_compile_error(compileError);

            if (failedIndex < 0 || static_cast<std::size_t>(failedIndex) >= candidates.size()) {
                throw std::runtime_error("HyperscanScanBackend: database compile failed: " + message);
            }

            const unsigned int patternIndex = candidates[static_cast<std::size_t>(failedIndex)];
            util::logger::warn("[HyperscanScanBackend] pattern '" + (*patterns_)[patternIndex].id() +
                               "' not supported by prefilter (" + message + "); always confirming it");
            alwaysConfirm_[patternIndex] = 1;
            candidates.erase(candidates.begin() + failedIndex);
        }

        if (database_) {
            hs_scratch_t *raw = nullptr;
            if (hs_alloc_scratch(database_.get(), &raw) != HS_SUCCESS) {
                throw std::runtime_error("HyperscanScanBackend: hs_alloc_scratch failed");
            }
            scratchPrototype_.reset(raw);
        }

        util::logger::info("[HyperscanScanBackend] prefilter database built for " +
                           std::to_string(patterns_->size()) + " patterns");
    }

    std::shared_ptr<const PatternList> patterns_;
    std::vector<char> alwaysConfirm_;
    DatabasePtr database_;
    ScratchPtr scratchPrototype_;
};

} // namespace

std::unique_ptr<ScanBackend> makeAcceleratedScanBackend(std::shared_ptr<const PatternList> patterns)
{
    return std::make_unique<HyperscanScanBackend>(std::move(patterns));
}

bool acceleratedScanCompiledIn()
{
    return true;
}

} // namespace scanner
} // namespace phiscan
