// test/unit/test_span_and_utils.cpp
// -----------------------------------------------------------
// Span invariants and the shared utilities (LRU cache, thread pool, text helpers).

#include <atomic>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <future>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/span.hpp"
#include "util/logger.hpp"
#include "util/lru_cache.hpp"
#include "util/text_utils.hpp"
#include "util/thread_pool.hpp"

namespace {

using phiscan::core::Span;

TEST(SpanTest, ConfidenceIsClampedOnConstruction) {
    Span high("SSN", "x", 0, 1, 1.7);
    Span low("SSN", "x", 0, 1, -0.3);
    Span nan("SSN", "x", 0, 1, std::numeric_limits<double>::quiet_NaN());

    EXPECT_DOUBLE_EQ(high.confidence, 1.0);
    EXPECT_DOUBLE_EQ(low.confidence, 0.0);
    EXPECT_DOUBLE_EQ(nan.confidence, 0.0);
}

TEST(SpanTest, EndNeverPrecedesStart) {
    Span s("NAME", "", 10, 4, 0.5);
    EXPECT_EQ(s.characterStart, (size_t)10);
    EXPECT_EQ(s.characterEnd, (size_t)10);
    EXPECT_EQ(s.length(), (size_t)0);
}

TEST(SpanTest, OverlapIsHalfOpen) {
    Span a("NAME", "a", 10, 20, 0.5);
    Span b("DATE", "b", 15, 25, 0.5);
    Span c("DATE", "c", 20, 30, 0.5);

    EXPECT_TRUE(a.overlaps(b));
    EXPECT_TRUE(b.overlaps(a));
    EXPECT_FALSE(a.overlaps(c));
}

TEST(SpanTest, AmbiguityIsIdempotent) {
    Span s("NAME", "x", 0, 1, 0.5);
    s.addAmbiguity("DATE");
    s.addAmbiguity("DATE");
    s.addAmbiguity("CITY");

    ASSERT_EQ(s.ambiguousWith.size(), (size_t)2);
    EXPECT_EQ(s.ambiguousWith[0], "DATE");
    EXPECT_EQ(s.ambiguousWith[1], "CITY");
    EXPECT_TRUE(s.isAmbiguousWith("CITY"));
}

TEST(SpanTest, ScaleConfidenceClamps) {
    Span s("NAME", "x", 0, 1, 0.95);
    s.scaleConfidence(1.1);
    EXPECT_DOUBLE_EQ(s.confidence, 1.0);
    s.setConfidence(-1.0);
    EXPECT_DOUBLE_EQ(s.confidence, 0.0);
}

TEST(LruCacheTest, EvictsLeastRecentlyUsed) {
    phiscan::util::LruCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    ASSERT_TRUE(cache.get("a").has_value()); // "a" is now most recent
    cache.put("c", 3);                        // evicts "b"

    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_EQ(*cache.get("c"), 3);
    EXPECT_EQ(cache.size(), (size_t)2);
}

TEST(LruCacheTest, LastWriteWins) {
    phiscan::util::LruCache<std::string, int> cache(4);
    cache.put("k", 1);
    cache.put("k", 2);
    EXPECT_EQ(*cache.get("k"), 2);
    EXPECT_EQ(cache.size(), (size_t)1);
}

TEST(LruCacheTest, ZeroCapacityDisablesCaching) {
    phiscan::util::LruCache<std::string, int> cache(0);
    cache.put("k", 1);
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), (size_t)0);
}

TEST(LruCacheTest, ConcurrentWritesToSameKey) {
    phiscan::util::LruCache<std::string, int> cache(8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 1000; ++i) {
                cache.put("shared", t);
                cache.get("shared");
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }

    auto value = cache.get("shared");
    ASSERT_TRUE(value.has_value());
    EXPECT_GE(*value, 0);
    EXPECT_LT(*value, 8);
    EXPECT_EQ(cache.size(), (size_t)1);
}

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
    phiscan::util::ThreadPool pool(3);
    EXPECT_EQ(pool.size(), (size_t)3);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.enqueue([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionsTravelThroughTheFuture) {
    phiscan::util::ThreadPool pool(1);
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(TextUtilsTest, Helpers) {
    using namespace phiscan::util;
    EXPECT_EQ(toLower("JoHn"), "john");
    EXPECT_EQ(trim("  a b \t"), "a b");
    EXPECT_EQ(countWords("John  Smith"), (size_t)2);
    EXPECT_EQ(countWords("   "), (size_t)1);
    EXPECT_TRUE(containsIgnoreCase("Chief Complaint: pain", "chief complaint"));
    EXPECT_EQ(digitsOnly("219-09-9999"), "219099999");

    auto parts = split("a,b,", ',');
    ASSERT_EQ(parts.size(), (size_t)3);
    EXPECT_EQ(parts[2], "");
}

TEST(LoggerTest, ParseLogLevel) {
    using namespace phiscan::util::logger;
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_THROW(parseLogLevel("chatty"), std::runtime_error);
}

TEST(LoggerTest, FileOutputHonorsLevel) {
    using namespace phiscan::util::logger;
    const std::string filename = "test_phiscan.log";
    Logger &log = Logger::getInstance();
    const LogLevel previous = log.getLogLevel();

    log.setConsoleOutput(false);
    log.setLogLevel(LogLevel::WARN);
    enableFileOutput(filename);
    info("below threshold");
    warn("scanner fell back");
    disableFileOutput();
    log.setConsoleOutput(true);
    log.setLogLevel(previous);

    std::ifstream in(filename);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str().find("below threshold"), std::string::npos);
    EXPECT_NE(contents.str().find("[WARN] scanner fell back"), std::string::npos);

    std::remove(filename.c_str());
}

} // anonymous namespace
