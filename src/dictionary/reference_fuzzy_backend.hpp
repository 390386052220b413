#ifndef PHISCAN_DICTIONARY_REFERENCE_FUZZY_BACKEND_HPP
#define PHISCAN_DICTIONARY_REFERENCE_FUZZY_BACKEND_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "fuzzy_backend.hpp"

namespace phiscan {
namespace dictionary {

/**
 * @class ReferenceFuzzyBackend
 * @brief Straightforward hash-map SymSpell index: an exact-term set, a map
 *        from deletion string to (term, distance) postings, and a Soundex map.
 *
 * Input terms must already be normalized. Terms shorter than minTermLength
 * and repeated terms are skipped.
 */
class ReferenceFuzzyBackend : public FuzzyBackend
{
public:
    struct Posting
    {
        std::string term;
        int distance = 0;
    };

    ReferenceFuzzyBackend(const std::vector<std::string> &terms, const FuzzyConfig &config)
        : config_(config)
    {
        for (const auto &term : terms) {
            if (term.size() < config_.minTermLength || !exactTerms_.insert(term).second) {
                continue;
            }

            for (auto &deletion : generateDeletions(term, config_.maxEditDistance, config_.minTermLength)) {
                deletionIndex_[deletion.text].push_back({term, deletion.distance});
            }

            if (config_.enablePhonetic) {
                const std::string code = soundex(term);
                if (hasSoundex(code)) {
                    phoneticIndex_[code].push_back(term);
                }
            }
        }
    }

    FuzzyMatch lookup(const std::string &query) const override
    {
        return symspellLookup(*this, query, config_);
    }

    bool contains(const std::string &term) const override
    {
        return exactTerms_.count(term) > 0;
    }

    std::size_t size() const override { return exactTerms_.size(); }

    std::size_t indexSize() const override { return deletionIndex_.size(); }

    std::string name() const override { return "reference"; }

    const std::string *findTerm(const std::string &term) const
    {
        auto it = exactTerms_.find(term);
        return it == exactTerms_.end() ? nullptr : &*it;
    }

    template<typename F>
    void forEachPosting(const std::string &key, F &&visit) const
    {
        auto it = deletionIndex_.find(key);
        if (it == deletionIndex_.end()) {
            return;
        }
        for (const auto &posting : it->second) {
            visit(posting.term);
        }
    }

    template<typename F>
    void forEachPhonetic(const std::string &code, F &&visit) const
    {
        auto it = phoneticIndex_.find(code);
        if (it == phoneticIndex_.end()) {
            return;
        }
        for (const auto &term : it->second) {
            visit(term);
        }
    }

private:
    FuzzyConfig config_;
    std::unordered_set<std::string> exactTerms_;
    std::unordered_map<std::string, std::vector<Posting>> deletionIndex_;
    std::unordered_map<std::string, std::vector<std::string>> phoneticIndex_;
};

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_REFERENCE_FUZZY_BACKEND_HPP
