#include "sigflow/signal/SignalBook.hpp"
#include "sigflow/util/Config.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace sigflow::signal;

namespace {

constexpr int64_t kMin = 60'000;
constexpr int64_t kT0  = 1'700'000'000'000;

Signal pendingSignal(const std::string& id, const std::string& tf, Direction d,
                     double entry, int64_t createdAt = kT0) {
    Signal s;
    s.id = id;
    s.timeframe = tf;
    s.direction = d;
    s.entryPrice = entry;
    s.createdAtMs = createdAt;
    s.score = 90;
    s.strength = strengthFor(s.score);
    return s;
}

} // namespace

TEST(SignalBookTest, CallWinsWhenPriceRises) {
    SignalBook book;
    ASSERT_TRUE(book.add(pendingSignal("sig-1", "5m", Direction::Call, 1.1000)));

    auto out = book.resolveDue(kT0 + 5 * kMin, 1.1010);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, Status::Win);
    EXPECT_DOUBLE_EQ(*out[0].pnl, 0.85);
    EXPECT_DOUBLE_EQ(*out[0].exitPrice, 1.1010);
    EXPECT_EQ(*out[0].resolvedAtMs, kT0 + 5 * kMin);
}

TEST(SignalBookTest, CallLosesWhenPriceFalls) {
    SignalBook book;
    book.add(pendingSignal("sig-1", "5m", Direction::Call, 1.1000));
    auto out = book.resolveDue(kT0 + 5 * kMin, 1.0990);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, Status::Loss);
    EXPECT_DOUBLE_EQ(*out[0].pnl, -1.0);
}

TEST(SignalBookTest, PutMirrorsCallAndUnchangedPriceLoses) {
    SignalBook book;
    book.add(pendingSignal("sig-1", "5m",  Direction::Put, 1.1000));
    book.add(pendingSignal("sig-2", "15m", Direction::Put, 1.1000));
    book.add(pendingSignal("sig-3", "30m", Direction::Call, 1.1000));

    auto out = book.resolveDue(kT0 + 30 * kMin, 1.1000);
    ASSERT_EQ(out.size(), 3u);
    for (const auto& s : out) EXPECT_EQ(s.status, Status::Loss) << s.id;

    SignalBook other;
    other.add(pendingSignal("sig-4", "5m", Direction::Put, 1.1000));
    auto win = other.resolveDue(kT0 + 5 * kMin, 1.0999);
    ASSERT_EQ(win.size(), 1u);
    EXPECT_EQ(win[0].status, Status::Win);
}

TEST(SignalBookTest, NotDueStaysPending) {
    SignalBook book;
    book.add(pendingSignal("sig-1", "5m", Direction::Call, 1.1000));

    EXPECT_TRUE(book.resolveDue(kT0 + 4 * kMin, 1.2000).empty());
    EXPECT_TRUE(book.resolveDue(kT0 + 5 * kMin - 1, 1.2000).empty());
    auto snap = book.snapshot();
    ASSERT_EQ(snap->size(), 1u);
    EXPECT_EQ(snap->front().status, Status::Pending);
    EXPECT_FALSE(snap->front().exitPrice.has_value());
    EXPECT_TRUE(book.hasPending("5m"));
}

TEST(SignalBookTest, ExpiryFollowsTimeframeLabel) {
    SignalBook book;
    book.add(pendingSignal("sig-1", "5m", Direction::Call, 1.0));
    book.add(pendingSignal("sig-2", "1h", Direction::Call, 1.0));

    auto first = book.resolveDue(kT0 + 30 * kMin, 2.0);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].id, "sig-1");
    EXPECT_TRUE(book.hasPending("1h"));

    auto second = book.resolveDue(kT0 + 60 * kMin, 2.0);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].id, "sig-2");
}

TEST(SignalBookTest, UnparseableTimeframeExpiresAfterFiveMinutes) {
    SignalBook book;
    book.add(pendingSignal("sig-1", "fortnight", Direction::Call, 1.0));
    EXPECT_TRUE(book.resolveDue(kT0 + 4 * kMin, 2.0).empty());
    EXPECT_EQ(book.resolveDue(kT0 + 5 * kMin, 2.0).size(), 1u);
}

TEST(SignalBookTest, OnePendingPerTimeframe) {
    SignalBook book;
    EXPECT_FALSE(book.hasPending("5m"));
    EXPECT_TRUE(book.add(pendingSignal("sig-1", "5m", Direction::Call, 1.0)));
    EXPECT_TRUE(book.hasPending("5m"));
    EXPECT_FALSE(book.add(pendingSignal("sig-2", "5m", Direction::Put, 1.0)));
    EXPECT_TRUE(book.add(pendingSignal("sig-3", "15m", Direction::Put, 1.0)));

    book.resolveDue(kT0 + 5 * kMin, 1.5);
    EXPECT_FALSE(book.hasPending("5m"));
    EXPECT_TRUE(book.add(pendingSignal("sig-4", "5m", Direction::Call, 1.5, kT0 + 5 * kMin)));
    EXPECT_EQ(book.snapshot()->size(), 3u);
    EXPECT_EQ(book.pending().size(), 2u);
}

TEST(SignalBookTest, RejectsAlreadyResolvedSignal) {
    SignalBook book;
    auto s = pendingSignal("sig-1", "5m", Direction::Call, 1.0);
    s.status = Status::Win;
    EXPECT_FALSE(book.add(s));
    EXPECT_TRUE(book.snapshot()->empty());
}

TEST(SignalBookTest, SnapshotsAreImmutable) {
    SignalBook book;
    book.add(pendingSignal("sig-1", "5m", Direction::Call, 1.0));
    auto before = book.snapshot();
    book.resolveDue(kT0 + 5 * kMin, 2.0);
    auto after = book.snapshot();

    EXPECT_EQ(before->front().status, Status::Pending);
    EXPECT_EQ(after->front().status, Status::Win);
    EXPECT_NE(before.get(), after.get());
}

TEST(SignalBookTest, StatsAndPayoutFromConfig) {
    sigflow::util::Config cfg;
    cfg.winPayout = 0.9;
    cfg.lossPayout = -0.75;
    SignalBook book(PayoutPolicy::fromConfig(cfg));

    book.add(pendingSignal("sig-1", "5m",  Direction::Call, 1.0));
    book.add(pendingSignal("sig-2", "15m", Direction::Call, 1.0));
    book.add(pendingSignal("sig-3", "30m", Direction::Put,  1.0));
    book.add(pendingSignal("sig-4", "1h",  Direction::Put,  1.0));
    book.resolveDue(kT0 + 30 * kMin, 1.5);   // 5m win, 15m win, 30m loss

    const auto st = book.stats();
    EXPECT_EQ(st.totalSignals, 4u);
    EXPECT_EQ(st.wins, 2u);
    EXPECT_EQ(st.losses, 1u);
    EXPECT_EQ(st.activeSignals, 1u);
    EXPECT_NEAR(st.winRate, 200.0 / 3.0, 1e-9);
    EXPECT_NEAR(st.netPnl, 0.9 + 0.9 - 0.75, 1e-12);
}

TEST(SignalBookTest, ResolvedHistoryIsBoundedButStatsCoverTheRun) {
    SignalBook book(PayoutPolicy{}, 3);

    // Ten rounds on 5m; each resolves before the next is added.
    for (int i = 0; i < 10; ++i) {
        const int64_t created = kT0 + i * 10 * kMin;
        ASSERT_TRUE(book.add(pendingSignal("sig-" + std::to_string(i + 1), "5m", Direction::Call, 1.0, created)));
        ASSERT_EQ(book.resolveDue(created + 5 * kMin, i % 2 == 0 ? 2.0 : 0.5).size(), 1u);
    }
    // A pending signal on another timeframe always stays.
    ASSERT_TRUE(book.add(pendingSignal("sig-11", "1h", Direction::Put, 1.0, kT0 + 200 * kMin)));

    auto snap = book.snapshot();
    ASSERT_EQ(snap->size(), 4u);
    EXPECT_EQ((*snap)[0].id, "sig-8");
    EXPECT_EQ((*snap)[1].id, "sig-9");
    EXPECT_EQ((*snap)[2].id, "sig-10");
    EXPECT_EQ((*snap)[3].id, "sig-11");
    EXPECT_TRUE((*snap)[3].pending());

    const auto st = book.stats();
    EXPECT_EQ(st.totalSignals, 11u);
    EXPECT_EQ(st.wins, 5u);
    EXPECT_EQ(st.losses, 5u);
    EXPECT_EQ(st.activeSignals, 1u);
    EXPECT_DOUBLE_EQ(st.winRate, 50.0);
    EXPECT_NEAR(st.netPnl, 5 * 0.85 - 5 * 1.0, 1e-12);
}

TEST(SignalBookTest, EmptyStats) {
    SignalBook book;
    const auto st = book.stats();
    EXPECT_EQ(st.totalSignals, 0u);
    EXPECT_DOUBLE_EQ(st.winRate, 0.0);
    EXPECT_DOUBLE_EQ(st.netPnl, 0.0);
}

TEST(SignalTest, StrengthTiers) {
    EXPECT_EQ(strengthFor(70.0),  Strength::Weak);
    EXPECT_EQ(strengthFor(70.5),  Strength::Moderate);
    EXPECT_EQ(strengthFor(85.0),  Strength::Moderate);
    EXPECT_EQ(strengthFor(85.1),  Strength::Strong);
    EXPECT_EQ(strengthFor(100.0), Strength::Strong);
    EXPECT_EQ(strengthFor(100.1), Strength::Max);
    EXPECT_STREQ(toString(Strength::Max), "MAX");
    EXPECT_STREQ(toString(Direction::Put), "PUT");
    EXPECT_STREQ(toString(Status::Pending), "PENDING");
}

TEST(SignalTest, IdsAreDeterministic) {
    SignalIdGenerator ids(41);
    EXPECT_EQ(ids.next(), "sig-42");
    EXPECT_EQ(ids.next(), "sig-43");
    ids.reseed(0);
    EXPECT_EQ(ids.next(), "sig-1");
}
