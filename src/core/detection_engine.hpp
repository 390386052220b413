#ifndef PHISCAN_CORE_DETECTION_ENGINE_HPP
#define PHISCAN_CORE_DETECTION_ENGINE_HPP

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "redaction_context.hpp"
#include "span.hpp"
#include "../dictionary/dictionary_loader.hpp"
#include "../dictionary/dictionary_tagger.hpp"
#include "../dictionary/fuzzy_dictionary_matcher.hpp"
#include "../pipeline/confidence_pipeline.hpp"
#include "../pipeline/http_confidence_ranker.hpp"
#include "../scanner/multi_pattern_scanner.hpp"
#include "../util/logger.hpp"
#include "../util/thread_pool.hpp"

/**
 * @file detection_engine.hpp
 * @brief Builds the scanner, the dictionary tagger and the confidence
 *        pipeline from one EngineConfig and runs them per document.
 *
 * detect() = pattern scan + dictionary tagging + confidence pipeline. The
 * returned spans are scored and ambiguity-annotated but not resolved against
 * each other; overlap resolution and redaction belong to the caller.
 *
 * Every component is owned by this object and shared with nothing else;
 * there are no process-wide instances.
 */

namespace phiscan {
namespace core {

struct DetectionResult
{
    std::vector<Span> spans;
    std::size_t patternCandidates = 0;
    std::size_t dictionaryCandidates = 0;
    double scanTimeMs = 0.0;
    double totalTimeMs = 0.0;
};

class DetectionEngine
{
public:
    /**
     * @param cfg Engine settings; every configured dictionary is loaded here.
     * @param patterns Pattern corpus for the scanner.
     * @throw std::runtime_error if a dictionary cannot be loaded or a
     *        component cannot be configured.
     */
    explicit DetectionEngine(const config::EngineConfig &cfg,
                             scanner::PatternList patterns = scanner::defaultPatterns())
        : config_(cfg),
          scanner_(std::make_shared<scanner::MultiPatternScanner>(std::move(patterns), cfg.scannerAccelerated)),
          tagger_(std::make_shared<dictionary::DictionaryTagger>(
              dictionary::TaggerConfig{cfg.taggerMinTokenLength, cfg.taggerMinConfidence})),
          pool_(std::make_unique<util::ThreadPool>(cfg.workerThreads))
    {
        pipeline::RerankOptions rerank;
        rerank.borderlineMin = cfg.mlBorderlineMin;
        rerank.borderlineMax = cfg.mlBorderlineMax;
        rerank.timeoutMs = cfg.mlTimeoutMs;

        std::shared_ptr<pipeline::ConfidenceRanker> ranker;
        if (cfg.mlEnabled) {
            if (cfg.mlEndpoint.empty()) {
                util::logger::warn("[DetectionEngine] ml.enabled without ml.endpoint; re-ranking disabled");
            } else {
                ranker = std::make_shared<pipeline::HttpConfidenceRanker>(cfg.mlEndpoint, cfg.mlTimeoutMs);
            }
        }
        pipeline_ = std::make_shared<pipeline::ConfidencePipeline>(
            cfg.stages, config::getDefaultDetectionParams(), std::move(ranker), rerank);

        for (const auto &dict : cfg.dictionaries) {
            addDictionary(dict.category, dictionary::DictionaryLoader::load(dict.source));
        }

        util::logger::info("[DetectionEngine] ready: scanner=" + scanner_->backendName() + ", " +
                           std::to_string(tagger_->dictionaryCount()) + " dictionaries, " +
                           std::to_string(pool_->size()) + " workers");
    }

    /**
     * @brief Assemble an engine from prebuilt components.
     */
    DetectionEngine(std::shared_ptr<scanner::MultiPatternScanner> scanner,
                    std::shared_ptr<dictionary::DictionaryTagger> tagger,
                    std::shared_ptr<pipeline::ConfidencePipeline> pipeline,
                    std::size_t workerThreads = 0)
        : scanner_(std::move(scanner)),
          tagger_(std::move(tagger)),
          pipeline_(std::move(pipeline)),
          pool_(std::make_unique<util::ThreadPool>(workerThreads))
    {
        if (!scanner_ || !tagger_ || !pipeline_) {
            throw std::runtime_error("DetectionEngine: scanner, tagger and pipeline are required");
        }
    }

    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;

    /**
     * @brief Build a fuzzy matcher for the category from in-memory terms and
     *        register it with the tagger. Not safe to call while detect() runs.
     */
    void addDictionary(const std::string &category, const std::vector<std::string> &terms,
                       double baseConfidence = 0.85)
    {
        dictionary::FuzzyConfig fuzzy;
        fuzzy.maxEditDistance = config_.fuzzyMaxEditDistance;
        fuzzy.minTermLength = config_.fuzzyMinTermLength;
        fuzzy.enablePhonetic = config_.fuzzyEnablePhonetic;
        fuzzy.cacheSize = config_.fuzzyCacheSize;

        auto matcher = std::make_shared<const dictionary::FuzzyDictionaryMatcher>(
            terms, fuzzy, config_.fuzzyAccelerated);
        tagger_->addDictionary(category, std::move(matcher), baseConfidence);
    }

    DetectionResult detect(const std::string &text, const RedactionContext &context = RedactionContext()) const
    {
        const auto start = std::chrono::steady_clock::now();
        DetectionResult result;

        scanner::ScanResult scanned = scanner_->scan(text);
        result.scanTimeMs = scanned.stats.scanTimeMs;
        result.patternCandidates = scanned.matches.size();

        std::vector<Span> candidates;
        candidates.reserve(scanned.matches.size());
        for (const auto &match : scanned.matches) {
            candidates.push_back(match.toSpan());
        }

        std::vector<Span> tagged = tagger_->tag(text);
        result.dictionaryCandidates = tagged.size();
        candidates.insert(candidates.end(), std::make_move_iterator(tagged.begin()),
                          std::make_move_iterator(tagged.end()));

        result.spans = pipeline_->execute(std::move(candidates), text, context);
        result.totalTimeMs = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - start).count();

        util::logger::debug("[DetectionEngine] " + context.documentId + ": " +
                            std::to_string(result.patternCandidates) + " pattern + " +
                            std::to_string(result.dictionaryCandidates) + " dictionary candidates -> " +
                            std::to_string(result.spans.size()) + " spans");
        return result;
    }

    /**
     * @brief detect() for several documents on the worker pool. Results are
     *        in input order.
     */
    std::vector<DetectionResult> detectBatch(const std::vector<std::string> &texts) const
    {
        std::vector<std::future<DetectionResult>> pending;
        pending.reserve(texts.size());
        for (std::size_t i = 0; i < texts.size(); ++i) {
            RedactionContext context;
            context.documentId = "doc-" + std::to_string(i);
            pending.push_back(pool_->enqueue([this, &texts, i, context]() {
                return detect(texts[i], context);
            }));
        }

        std::vector<DetectionResult> results;
        results.reserve(pending.size());
        for (auto &f : pending) {
            results.push_back(f.get());
        }
        return results;
    }

    /// Pipeline summary of the most recent document.
    std::optional<pipeline::PipelineSummary> lastSummary() const
    {
        return pipeline_->getLastSummary();
    }

    const scanner::MultiPatternScanner &scanner() const { return *scanner_; }
    const dictionary::DictionaryTagger &tagger() const { return *tagger_; }
    pipeline::ConfidencePipeline &pipeline() { return *pipeline_; }

private:
    config::EngineConfig config_;
    std::shared_ptr<scanner::MultiPatternScanner> scanner_;
    std::shared_ptr<dictionary::DictionaryTagger> tagger_;
    std::shared_ptr<pipeline::ConfidencePipeline> pipeline_;
    std::unique_ptr<util::ThreadPool> pool_;
};

} // namespace core
} // namespace phiscan

#endif // PHISCAN_CORE_DETECTION_ENGINE_HPP
