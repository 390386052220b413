#ifndef PHISCAN_PIPELINE_HTTP_CONFIDENCE_RANKER_HPP
#define PHISCAN_PIPELINE_HTTP_CONFIDENCE_RANKER_HPP

#include <future>
#include <string>
#include <vector>

#include "confidence_ranker.hpp"
#include "../core/span.hpp"
#include "../util/thread_pool.hpp"

/*
  HttpConfidenceRanker
  --------------------------------------------------------
  ConfidenceRanker that asks a model server over HTTP.

  Request (POST <endpoint>, Content-Type: application/json):
    {"text":"...","spans":[{"start":10,"end":21,"category":"SSN","confidence":0.55}, ...]}

  Response:
    {"confidences":[0.62, ...]}     one value per request span, same order

  Requests run on the ranker's own worker threads, so rerank() returns at
  once. Each request is bounded by CURLOPT_TIMEOUT_MS; a transport error, a
  non-2xx status or a malformed reply fails the future with
  std::runtime_error, which the pipeline stage turns into a pass-through.
*/

namespace phiscan {
namespace pipeline {

class HttpConfidenceRanker : public ConfidenceRanker
{
public:
    /**
     * @param endpoint Full URL, e.g. "http://127.0.0.1:8090/rerank".
     * @param timeoutMs Transfer timeout of one request.
     * @param workers Concurrent requests.
     */
    explicit HttpConfidenceRanker(std::string endpoint, long timeoutMs = 250, std::size_t workers = 2);

    std::future<std::vector<core::Span>> rerank(const std::vector<core::Span> &spans,
                                                const std::string &text) override;

    std::string name() const override { return "http(" + endpoint_ + ")"; }

    const std::string &endpoint() const { return endpoint_; }

    static std::string buildRequestBody(const std::vector<core::Span> &spans, const std::string &text);

    /// @throw std::runtime_error if the reply has no "confidences" array of `expected` numbers.
    static std::vector<double> parseConfidences(const std::string &response, std::size_t expected);

    static std::string escapeJson(const std::string &s);

private:
    std::string post(const std::string &body) const;

    std::string endpoint_;
    long timeoutMs_;
    util::ThreadPool pool_;
};

} // namespace pipeline
} // namespace phiscan

#endif // PHISCAN_PIPELINE_HTTP_CONFIDENCE_RANKER_HPP
