// test/unit/test_http_confidence_ranker.cpp
// -----------------------------------------------------------
// Request/reply encoding of the HTTP re-ranker and its failure path.

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "pipeline/confidence_stages.hpp"
#include "pipeline/http_confidence_ranker.hpp"

namespace {

using phiscan::core::Span;
using phiscan::pipeline::HttpConfidenceRanker;
using phiscan::pipeline::RerankOptions;

TEST(HttpConfidenceRankerTest, BuildsRequestBody) {
    std::vector<Span> spans = {Span("NAME", "Jon", 9, 12, 0.5), Span("SSN", "x", 20, 31, 0.25)};
    const std::string body = HttpConfidenceRanker::buildRequestBody(spans, "Patient \"Jon\"\n");

    EXPECT_EQ(body,
              "{\"text\":\"Patient \\\"Jon\\\"\\n\",\"spans\":["
              "{\"start\":9,\"end\":12,\"category\":\"NAME\",\"confidence\":0.5},"
              "{\"start\":20,\"end\":31,\"category\":\"SSN\",\"confidence\":0.25}]}");
}

TEST(HttpConfidenceRankerTest, EscapesControlCharacters) {
    EXPECT_EQ(HttpConfidenceRanker::escapeJson("a\\b\t\x01"), "a\\\\b\\t\\u0001");
}

TEST(HttpConfidenceRankerTest, ParsesConfidences) {
    auto values = HttpConfidenceRanker::parseConfidences("{\"model\":\"v2\", \"confidences\": [0.62, 0.1 ,1]}", 3);
    ASSERT_EQ(values.size(), (size_t)3);
    EXPECT_DOUBLE_EQ(values[0], 0.62);
    EXPECT_DOUBLE_EQ(values[1], 0.1);
    EXPECT_DOUBLE_EQ(values[2], 1.0);

    EXPECT_TRUE(HttpConfidenceRanker::parseConfidences("{\"confidences\":[]}", 0).empty());
}

TEST(HttpConfidenceRankerTest, RejectsMalformedReplies) {
    EXPECT_THROW(HttpConfidenceRanker::parseConfidences("{\"scores\":[0.5]}", 1), std::runtime_error);
    EXPECT_THROW(HttpConfidenceRanker::parseConfidences("{\"confidences\":[0.5, 0.6]}", 1), std::runtime_error);
    EXPECT_THROW(HttpConfidenceRanker::parseConfidences("{\"confidences\":[0.5, high]}", 2), std::runtime_error);
    EXPECT_THROW(HttpConfidenceRanker::parseConfidences("{\"confidences\":[0.5", 1), std::runtime_error);
}

TEST(HttpConfidenceRankerTest, EmptyEndpointIsRejected) {
    EXPECT_THROW(HttpConfidenceRanker(""), std::runtime_error);
}

TEST(HttpConfidenceRankerTest, UnreachableServerFailsTheFuture) {
    HttpConfidenceRanker ranker("http://127.0.0.1:1/rerank", 500);
    auto pending = ranker.rerank({Span("NAME", "Jon", 0, 3, 0.5)}, "Jon");
    EXPECT_THROW(pending.get(), std::runtime_error);
}

TEST(HttpConfidenceRankerTest, StagePassesThroughWhenServerIsUnreachable) {
    HttpConfidenceRanker ranker("http://127.0.0.1:1/rerank", 500);
    RerankOptions options;
    options.timeoutMs = 1000;

    auto out = phiscan::pipeline::stages::mlConfidenceRanking({Span("NAME", "Jon", 0, 3, 0.5)}, "Jon",
                                                              &ranker, options);
    ASSERT_EQ(out.size(), (size_t)1);
    EXPECT_DOUBLE_EQ(out[0].confidence, 0.5);
}

} // anonymous namespace
