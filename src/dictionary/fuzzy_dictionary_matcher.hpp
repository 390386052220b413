#ifndef PHISCAN_DICTIONARY_FUZZY_DICTIONARY_MATCHER_HPP
#define PHISCAN_DICTIONARY_FUZZY_DICTIONARY_MATCHER_HPP

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "compact_fuzzy_backend.hpp"
#include "fuzzy_backend.hpp"
#include "fuzzy_types.hpp"
#include "reference_fuzzy_backend.hpp"
#include "../util/logger.hpp"
#include "../util/lru_cache.hpp"
#include "../util/text_utils.hpp"

/**
 * @file fuzzy_dictionary_matcher.hpp
 * @brief Bounded edit-distance dictionary lookups (SymSpell deletion index
 *        with a Soundex fallback).
 *
 * DESIGN GOALS:
 *   - Query cost independent of dictionary size: candidates come from the
 *     precomputed deletion index, never from a scan of the dictionary.
 *   - Backend chosen once, at construction. The compact backend is preferred;
 *     if it cannot be built, or throws for a query, the reference backend
 *     answers instead and the caller sees the same result.
 *   - The result cache is an LruCache owned by this instance, keyed by the
 *     normalized query. Misses are cached too.
 *
 * USAGE EXAMPLE:
 *   @code
 *   phiscan::dictionary::FuzzyDictionaryMatcher names({"john", "jonathan", "jane"});
 *   auto m = names.lookup("Jon");   // m.term == "john", m.matchType == MatchType::DELETE_1
 *   @endcode
 */

namespace phiscan {
namespace dictionary {

class FuzzyDictionaryMatcher
{
public:
    /**
     * @param terms Dictionary terms; normalized (trimmed, lowercased) here.
     * @param config Index and cache parameters.
     * @param preferAccelerated Try the compact backend first.
     */
    explicit FuzzyDictionaryMatcher(const std::vector<std::string> &terms,
                                    FuzzyConfig config = FuzzyConfig(),
                                    bool preferAccelerated = true)
        : config_(config),
          cache_(config.cacheSize)
    {
        std::vector<std::string> normalized = normalizeAll(terms);

        if (preferAccelerated) {
            try {
                accelerated_ = makeAcceleratedFuzzyBackend(normalized, config_);
            } catch (const std::exception &ex) {
                util::logger::warn(std::string("[FuzzyDictionaryMatcher] accelerated backend unavailable: ") +
                                   ex.what() + "; using reference backend");
                accelerated_.reset();
            }
        }

        if (accelerated_) {
            retainedTerms_ = std::move(normalized);
        } else {
            buildReference(normalized);
        }
        logSelection();
    }

    /**
     * @brief Construct with an explicit accelerated backend (nullptr for
     *        reference only). The backend must have been built from `terms`
     *        with `config`.
     */
    FuzzyDictionaryMatcher(const std::vector<std::string> &terms,
                           FuzzyConfig config,
                           std::unique_ptr<FuzzyBackend> accelerated)
        : config_(config),
          cache_(config.cacheSize),
          accelerated_(std::move(accelerated))
    {
        std::vector<std::string> normalized = normalizeAll(terms);
        if (accelerated_) {
            retainedTerms_ = std::move(normalized);
        } else {
            buildReference(normalized);
        }
        logSelection();
    }

    FuzzyDictionaryMatcher(const FuzzyDictionaryMatcher&) = delete;
    FuzzyDictionaryMatcher& operator=(const FuzzyDictionaryMatcher&) = delete;

    static std::string normalize(const std::string &s)
    {
        return util::toLower(util::trim(s));
    }

    /**
     * @brief Look up a query. "No match" is an ordinary result.
     */
    FuzzyMatch lookup(const std::string &query) const
    {
        const std::string key = normalize(query);

        if (auto cached = cache_.get(key)) {
            cacheHits_.fetch_add(1, std::memory_order_relaxed);
            return *cached;
        }

        FuzzyMatch result;
        if (accelerated_ && !acceleratedFailed_.load(std::memory_order_acquire)) {
            try {
                result = accelerated_->lookup(key);
            } catch (const std::exception &ex) {
                util::logger::warn("[FuzzyDictionaryMatcher] " + accelerated_->name() +
                                   " backend failed (" + ex.what() + "); using reference backend");
                acceleratedFailed_.store(true, std::memory_order_release);
                result = referenceBackend().lookup(key);
            }
        } else {
            result = referenceBackend().lookup(key);
        }

        count(result.matchType);
        cache_.put(key, result);
        return result;
    }

    /// Exact membership of the normalized term.
    bool has(const std::string &term) const
    {
        const std::string key = normalize(term);
        if (accelerated_ && !acceleratedFailed_.load(std::memory_order_acquire)) {
            try {
                return accelerated_->contains(key);
            } catch (const std::exception &ex) {
                util::logger::warn("[FuzzyDictionaryMatcher] " + accelerated_->name() +
                                   " backend failed (" + ex.what() + "); using reference backend");
                acceleratedFailed_.store(true, std::memory_order_release);
            }
        }
        return referenceBackend().contains(key);
    }

    double getConfidence(const std::string &query) const
    {
        return lookup(query).confidence;
    }

    std::size_t size() const { return activeBackend().size(); }

    std::size_t indexSize() const { return activeBackend().indexSize(); }

    void clearCache() { cache_.clear(); }

    bool isAccelerated() const { return static_cast<bool>(accelerated_); }

    std::string backendName() const { return activeBackend().name(); }

    const FuzzyConfig &config() const { return config_; }

    FuzzyStats getStats() const
    {
        FuzzyStats s;
        s.terms = size();
        s.indexEntries = indexSize();
        s.cacheEntries = cache_.size();
        s.exactHits = exactHits_.load(std::memory_order_relaxed);
        s.deletionHits = deletionHits_.load(std::memory_order_relaxed);
        s.phoneticHits = phoneticHits_.load(std::memory_order_relaxed);
        s.cacheHits = cacheHits_.load(std::memory_order_relaxed);
        s.misses = misses_.load(std::memory_order_relaxed);
        s.backend = backendName();
        return s;
    }

    static std::unique_ptr<FuzzyDictionaryMatcher> forFirstNames(const std::vector<std::string> &terms)
    {
        return std::make_unique<FuzzyDictionaryMatcher>(terms, FuzzyConfig::forFirstNames());
    }

    static std::unique_ptr<FuzzyDictionaryMatcher> forSurnames(const std::vector<std::string> &terms)
    {
        return std::make_unique<FuzzyDictionaryMatcher>(terms, FuzzyConfig::forSurnames());
    }

    static std::unique_ptr<FuzzyDictionaryMatcher> forLocations(const std::vector<std::string> &terms)
    {
        return std::make_unique<FuzzyDictionaryMatcher>(terms, FuzzyConfig::forLocations());
    }

    static std::unique_ptr<FuzzyDictionaryMatcher> strict(const std::vector<std::string> &terms)
    {
        return std::make_unique<FuzzyDictionaryMatcher>(terms, FuzzyConfig::strict());
    }

private:
    static std::vector<std::string> normalizeAll(const std::vector<std::string> &terms)
    {
        std::vector<std::string> out;
        out.reserve(terms.size());
        for (const auto &t : terms) {
            out.push_back(normalize(t));
        }
        return out;
    }

    void buildReference(const std::vector<std::string> &normalized) const
    {
        reference_ = std::make_unique<ReferenceFuzzyBackend>(normalized, config_);
    }

    // Built at construction when there is no accelerated backend, otherwise
    // on the first accelerated failure.
    const FuzzyBackend &referenceBackend() const
    {
        std::call_once(referenceOnce_, [this]() {
            if (!reference_) {
                buildReference(retainedTerms_);
            }
        });
        return *reference_;
    }

    const FuzzyBackend &activeBackend() const
    {
        if (accelerated_ && !acceleratedFailed_.load(std::memory_order_acquire)) {
            return *accelerated_;
        }
        return referenceBackend();
    }

    void count(MatchType type) const
    {
        switch (type) {
            case MatchType::EXACT:
                exactHits_.fetch_add(1, std::memory_order_relaxed);
                break;
            case MatchType::DELETE_1:
            case MatchType::DELETE_2:
                deletionHits_.fetch_add(1, std::memory_order_relaxed);
                break;
            case MatchType::PHONETIC:
                phoneticHits_.fetch_add(1, std::memory_order_relaxed);
                break;
            case MatchType::NONE:
                misses_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    void logSelection() const
    {
        util::logger::info("[FuzzyDictionaryMatcher] " + std::to_string(size()) + " terms, " +
                           std::to_string(indexSize()) + " deletion keys, backend=" + backendName());
    }

    FuzzyConfig config_;
    mutable util::LruCache<std::string, FuzzyMatch> cache_;
    std::unique_ptr<FuzzyBackend> accelerated_;
    mutable std::unique_ptr<FuzzyBackend> reference_;
    mutable std::once_flag referenceOnce_;
    std::vector<std::string> retainedTerms_;
    mutable std::atomic<bool> acceleratedFailed_{false};

    mutable std::atomic<uint64_t> exactHits_{0};
    mutable std::atomic<uint64_t> deletionHits_{0};
    mutable std::atomic<uint64_t> phoneticHits_{0};
    mutable std::atomic<uint64_t> cacheHits_{0};
    mutable std::atomic<uint64_t> misses_{0};
};

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_FUZZY_DICTIONARY_MATCHER_HPP
