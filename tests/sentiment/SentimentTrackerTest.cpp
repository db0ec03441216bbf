#include "sigflow/sentiment/SentimentTracker.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <thread>
#include <vector>

using namespace sigflow::sentiment;

namespace {
NewsEvent news(Sentiment s, Impact i, const char* headline = "headline") {
    NewsEvent ev;
    ev.headline = headline;
    ev.sentiment = s;
    ev.impact = i;
    return ev;
}
}

TEST(SentimentTrackerTest, ImpactPoints) {
    EXPECT_DOUBLE_EQ(impactPoints(news(Sentiment::Positive, Impact::High)), 25.0);
    EXPECT_DOUBLE_EQ(impactPoints(news(Sentiment::Positive, Impact::Medium)), 15.0);
    EXPECT_DOUBLE_EQ(impactPoints(news(Sentiment::Negative, Impact::Low)), -5.0);
    EXPECT_DOUBLE_EQ(impactPoints(news(Sentiment::Neutral, Impact::High)), 0.0);
}

TEST(SentimentTrackerTest, AddNewsClampsToRange) {
    SentimentTracker t;
    for (int i = 0; i < 6; ++i) t.addNews(news(Sentiment::Positive, Impact::High));
    EXPECT_DOUBLE_EQ(t.peek(), 100.0);
    for (int i = 0; i < 12; ++i) t.addNews(news(Sentiment::Negative, Impact::High));
    EXPECT_DOUBLE_EQ(t.peek(), -100.0);
}

TEST(SentimentTrackerTest, ReadDecaysMonotonicallyWithoutOvershoot) {
    SentimentTracker t;
    t.addNews(news(Sentiment::Positive, Impact::High));
    double prev = t.peek();
    for (int i = 0; i < 2000; ++i) {
        const double v = t.read();
        ASSERT_GE(v, 0.0);
        ASSERT_LE(v, prev);
        prev = v;
    }
    EXPECT_DOUBLE_EQ(prev, 0.0);
}

TEST(SentimentTrackerTest, NegativeScoreDecaysTowardZeroFromBelow) {
    SentimentTracker t;
    t.addNews(news(Sentiment::Negative, Impact::Medium));
    const double first = t.read();
    EXPECT_DOUBLE_EQ(first, -15.0 * SentimentTracker::kDecay);
    double v = first;
    while (v != 0.0) {
        const double next = t.read();
        ASSERT_LE(next, 0.0);
        ASSERT_GE(next, v);
        v = next;
    }
}

TEST(SentimentTrackerTest, SnapsSmallScoresToZero) {
    SentimentTracker t;
    t.addNews(news(Sentiment::Positive, Impact::Low));
    // 5 * 0.995^n < 1 after n = 322 reads
    for (int i = 0; i < 321; ++i) EXPECT_GT(t.read(), 0.0);
    EXPECT_DOUBLE_EQ(t.read(), 0.0);
}

TEST(SentimentTrackerTest, PeekDoesNotDecay) {
    SentimentTracker t;
    t.addNews(news(Sentiment::Positive, Impact::High));
    EXPECT_DOUBLE_EQ(t.peek(), 25.0);
    EXPECT_DOUBLE_EQ(t.peek(), 25.0);
}

TEST(SentimentTrackerTest, LastNewsAndReset) {
    SentimentTracker t;
    EXPECT_FALSE(t.lastNews().has_value());
    t.addNews(news(Sentiment::Positive, Impact::High, "Rate cut"));
    ASSERT_TRUE(t.lastNews().has_value());
    EXPECT_EQ(t.lastNews()->headline, "Rate cut");
    t.reset();
    EXPECT_DOUBLE_EQ(t.peek(), 0.0);
    EXPECT_FALSE(t.lastNews().has_value());
}

TEST(SentimentTrackerTest, ConcurrentNewsAndReads) {
    SentimentTracker t;
    std::vector<std::thread> ts;
    for (int w = 0; w < 4; ++w) {
        ts.emplace_back([&t](){
            for (int i = 0; i < 200; ++i) {
                t.addNews(news(i % 2 ? Sentiment::Positive : Sentiment::Negative, Impact::Medium));
                t.read();
            }
        });
    }
    for (auto& th : ts) th.join();
    EXPECT_LE(std::abs(t.peek()), SentimentTracker::kMax);
}

TEST(NewsEventTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseSentiment("positive"), Sentiment::Positive);
    EXPECT_EQ(parseSentiment("NEGATIVE"), Sentiment::Negative);
    EXPECT_FALSE(parseSentiment("bullish").has_value());
    EXPECT_EQ(parseImpact("Medium"), Impact::Medium);
    EXPECT_FALSE(parseImpact("").has_value());
    EXPECT_STREQ(toString(Impact::High), "HIGH");
}
