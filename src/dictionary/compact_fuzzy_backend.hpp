#ifndef PHISCAN_DICTIONARY_COMPACT_FUZZY_BACKEND_HPP
#define PHISCAN_DICTIONARY_COMPACT_FUZZY_BACKEND_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "fuzzy_backend.hpp"

/**
 * @file compact_fuzzy_backend.hpp
 * @brief Flat-array SymSpell index.
 *
 * Terms are stored once and referred to by a 32-bit id. Deletion postings are
 * laid out CSR style: the (key, termId) pairs are stable-sorted by key, each
 * distinct key gets one slot, and offsets_[k] .. offsets_[k+1] delimits its
 * term ids in postings_. A posting list therefore holds term ids in term
 * insertion order, which keeps lookups identical to ReferenceFuzzyBackend.
 * Soundex codes are packed into a uint32_t.
 */

namespace phiscan {
namespace dictionary {

class CompactFuzzyBackend : public FuzzyBackend
{
public:
    CompactFuzzyBackend(const std::vector<std::string> &terms, const FuzzyConfig &config)
        : config_(config)
    {
        {
            std::unordered_set<std::string> seen;
            for (const auto &term : terms) {
                if (term.size() >= config_.minTermLength && seen.insert(term).second) {
                    terms_.push_back(term);
                }
            }
        }
        if (terms_.size() > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("CompactFuzzyBackend: too many terms");
        }

        termIds_.reserve(terms_.size());
        for (uint32_t id = 0; id < terms_.size(); ++id) {
            termIds_.emplace(terms_[id], id);
        }

        buildPostings();

        if (config_.enablePhonetic) {
            for (uint32_t id = 0; id < terms_.size(); ++id) {
                const std::string code = soundex(terms_[id]);
                if (hasSoundex(code)) {
                    phonetic_[packCode(code)].push_back(id);
                }
            }
        }
    }

    CompactFuzzyBackend(const CompactFuzzyBackend&) = delete;
    CompactFuzzyBackend& operator=(const CompactFuzzyBackend&) = delete;

    FuzzyMatch lookup(const std::string &query) const override
    {
        return symspellLookup(*this, query, config_);
    }

    bool contains(const std::string &term) const override
    {
        return termIds_.find(term) != termIds_.end();
    }

    std::size_t size() const override { return terms_.size(); }

    std::size_t indexSize() const override { return keys_.size(); }

    std::string name() const override { return "compact"; }

    const std::string *findTerm(const std::string &term) const
    {
        auto it = termIds_.find(term);
        return it == termIds_.end() ? nullptr : &terms_[it->second];
    }

    template<typename F>
    void forEachPosting(const std::string &key, F &&visit) const
    {
        auto it = keyIds_.find(key);
        if (it == keyIds_.end()) {
            return;
        }
        const uint32_t k = it->second;
        for (uint32_t p = offsets_[k]; p < offsets_[k + 1]; ++p) {
            visit(terms_[postings_[p]]);
        }
    }

    template<typename F>
    void forEachPhonetic(const std::string &code, F &&visit) const
    {
        auto it = phonetic_.find(packCode(code));
        if (it == phonetic_.end()) {
            return;
        }
        for (uint32_t id : it->second) {
            visit(terms_[id]);
        }
    }

private:
    struct KeyedPosting
    {
        std::string key;
        uint32_t termId;
    };

    static uint32_t packCode(const std::string &code)
    {
        uint32_t packed = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            const unsigned char c = i < code.size() ? static_cast<unsigned char>(code[i]) : 0;
            packed = (packed << 8) | c;
        }
        return packed;
    }

    void buildPostings()
    {
        std::vector<KeyedPosting> pairs;
        for (uint32_t id = 0; id < terms_.size(); ++id) {
            for (auto &deletion : generateDeletions(terms_[id], config_.maxEditDistance, config_.minTermLength)) {
                pairs.push_back({std::move(deletion.text), id});
            }
        }

        std::stable_sort(pairs.begin(), pairs.end(),
                         [](const KeyedPosting &a, const KeyedPosting &b) { return a.key < b.key; });

        postings_.reserve(pairs.size());
        for (auto &pair : pairs) {
            if (keys_.empty() || keys_.back() != pair.key) {
                offsets_.push_back(static_cast<uint32_t>(postings_.size()));
                keys_.push_back(std::move(pair.key));
            }
            postings_.push_back(pair.termId);
        }
        offsets_.push_back(static_cast<uint32_t>(postings_.size()));

        keyIds_.reserve(keys_.size());
        for (uint32_t k = 0; k < keys_.size(); ++k) {
            keyIds_.emplace(keys_[k], k);
        }
    }

    FuzzyConfig config_;
    std::vector<std::string> terms_;
    std::unordered_map<std::string_view, uint32_t> termIds_;    ///< Views into terms_
    std::vector<std::string> keys_;                             ///< Distinct deletion keys, sorted
    std::unordered_map<std::string_view, uint32_t> keyIds_;     ///< Views into keys_
    std::vector<uint32_t> offsets_;                             ///< keys_.size() + 1 entries
    std::vector<uint32_t> postings_;                            ///< Term ids
    std::unordered_map<uint32_t, std::vector<uint32_t>> phonetic_;
};

/**
 * @brief Build the accelerated fuzzy backend.
 * @throw std::exception if the index cannot be built.
 */
inline std::unique_ptr<FuzzyBackend> makeAcceleratedFuzzyBackend(const std::vector<std::string> &terms,
                                                                 const FuzzyConfig &config)
{
    return std::make_unique<CompactFuzzyBackend>(terms, config);
}

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_COMPACT_FUZZY_BACKEND_HPP
