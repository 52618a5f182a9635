#include <gtest/gtest.h>
#include "market/market_strategy.h"
#include <atomic>
#include <cmath>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace bazaar;
using namespace bazaar::market;

class MarketStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        adjusted = std::make_unique<UsageFactorMarketStrategy>(pool, ledger, MarketSettings());
        pooling = std::make_unique<PoolingMarketStrategy>(pool, ledger, MarketSettings());
    }

    static Offer makeOffer(const std::string& provider, double price, double perf) {
        Offer o;
        o.providerId = provider;
        o.price = price;
        o.declaredPerformance = perf;
        return o;
    }

    static std::vector<std::string> providers(const std::vector<Offer>& offers) {
        std::vector<std::string> ids;
        for (const auto& o : offers) ids.push_back(o.providerId);
        return ids;
    }

    OfferPool pool;
    UsageLedger ledger;
    std::unique_ptr<UsageFactorMarketStrategy> adjusted;
    std::unique_ptr<PoolingMarketStrategy> pooling;
};

TEST_F(MarketStrategyTest, Identifiers) {
    EXPECT_EQ(adjusted->id(), "usage-factor-adjusted");
    EXPECT_EQ(pooling->id(), "pooling-only");
    EXPECT_DOUBLE_EQ(adjusted->getMyUsageBenchmark(), 1.0);
}

TEST_F(MarketStrategyTest, UsageFeedbackFlipsRanking) {
    adjusted->add("task", makeOffer("A", 5.0, 800.0));
    adjusted->add("task", makeOffer("B", 6.0, 1250.0));

    auto first = adjusted->resolveTaskOffersScored("task");
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].offer.providerId, "B");
    EXPECT_NEAR(first[0].effectivePrice, 0.0048, 1e-12);
    EXPECT_NEAR(first[1].effectivePrice, 0.00625, 1e-12);

    auto report = adjusted->reportSubtaskUsages("task", {{"A", "s1", 5.0}, {"B", "s2", 8.0}});
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.applied, 2u);
    EXPECT_DOUBLE_EQ(adjusted->getUsageFactor("A", 1.0), 5.0);
    EXPECT_DOUBLE_EQ(adjusted->getUsageFactor("B", 1.0), 8.0);

    adjusted->add("task", makeOffer("A", 5.0, 800.0));
    adjusted->add("task", makeOffer("B", 6.0, 1250.0));
    auto second = adjusted->resolveTaskOffersScored("task");
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0].offer.providerId, "A");
    EXPECT_NEAR(second[0].effectivePrice, 0.03125, 1e-12);
    EXPECT_NEAR(second[1].effectivePrice, 0.0384, 1e-12);
    EXPECT_DOUBLE_EQ(second[0].usageFactor, 5.0);
}

TEST_F(MarketStrategyTest, DeterministicOrderWithTies) {
    for (int round = 0; round < 3; round++) {
        adjusted->add("task", makeOffer("x", 2.0, 100.0));
        adjusted->add("task", makeOffer("y", 1.0, 50.0));
        adjusted->add("task", makeOffer("z", 0.5, 100.0));
        auto ranked = adjusted->resolveTaskOffers("task");
        EXPECT_EQ(providers(ranked), (std::vector<std::string>{"z", "x", "y"}));
    }
}

TEST_F(MarketStrategyTest, ResolveDrainsPool) {
    adjusted->add("task", makeOffer("A", 1.0, 1.0));
    adjusted->add("task", makeOffer("B", 1.0, 1.0));
    EXPECT_EQ(adjusted->getTaskOfferCount("task"), 2u);

    EXPECT_EQ(adjusted->resolveTaskOffers("task").size(), 2u);
    EXPECT_EQ(adjusted->getTaskOfferCount("task"), 0u);
    EXPECT_TRUE(adjusted->resolveTaskOffers("task").empty());

    adjusted->add("task", makeOffer("C", 1.0, 1.0));
    EXPECT_EQ(providers(adjusted->resolveTaskOffers("task")), (std::vector<std::string>{"C"}));
}

TEST_F(MarketStrategyTest, UnknownTaskIsSafe) {
    EXPECT_EQ(adjusted->getTaskOfferCount("nope"), 0u);
    EXPECT_TRUE(adjusted->resolveTaskOffers("nope").empty());
    EXPECT_TRUE(pooling->resolveTaskOffersScored("nope").empty());
    adjusted->clearOffersForTask("nope");
    EXPECT_DOUBLE_EQ(adjusted->getUsageFactor("never-seen", 3.0), 1.0);
}

TEST_F(MarketStrategyTest, ClearOffersForTask) {
    adjusted->add("a", makeOffer("A", 1.0, 1.0));
    adjusted->add("b", makeOffer("B", 1.0, 1.0));
    adjusted->clearOffersForTask("a");
    EXPECT_EQ(adjusted->getTaskOfferCount("a"), 0u);
    EXPECT_EQ(adjusted->getTaskOfferCount("b"), 1u);
}

TEST_F(MarketStrategyTest, ResetIsIdempotent) {
    adjusted->add("task", makeOffer("A", 1.0, 1.0));
    auto first = adjusted->reportSubtaskUsages("task", {{"A", "s", 4.0}});
    EXPECT_TRUE(first.ok());
    adjusted->reset();
    adjusted->reset();
    EXPECT_EQ(adjusted->getTaskOfferCount("task"), 0u);
    EXPECT_DOUBLE_EQ(adjusted->getUsageFactor("A", 1.0), 1.0);

    // The same subtask may be reported again after a reset.
    auto again = adjusted->reportSubtaskUsages("task", {{"A", "s", 4.0}});
    EXPECT_TRUE(again.ok());
}

TEST_F(MarketStrategyTest, InvalidOffersExcluded) {
    adjusted->add("task", makeOffer("neg", -1.0, 100.0));
    adjusted->add("task", makeOffer("ok", 1.0, 100.0));
    adjusted->add("task", makeOffer("zero-perf", 1.0, 0.0));
    adjusted->add("task", makeOffer("", 1.0, 100.0));

    auto ranked = adjusted->resolveTaskOffersScored("task");
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].offer.providerId, "ok");
    EXPECT_TRUE(ranked[0].valid);
    EXPECT_EQ(adjusted->getTaskOfferCount("task"), 0u);
}

TEST_F(MarketStrategyTest, FreeOfferRanksFirst) {
    adjusted->add("task", makeOffer("paid", 0.5, 100.0));
    adjusted->add("task", makeOffer("free", 0.0, 1.0));
    ASSERT_TRUE(ledger.recordUsage("free", 50.0, 1.0).ok());

    auto ranked = adjusted->resolveTaskOffersScored("task");
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].offer.providerId, "free");
    EXPECT_TRUE(ranked[0].valid);
    EXPECT_DOUBLE_EQ(ranked[0].effectivePrice, 0.0);
    EXPECT_EQ(ranked[1].offer.providerId, "paid");
}

TEST_F(MarketStrategyTest, InvalidOffersPlacedLast) {
    MarketSettings settings;
    settings.invalidOfferPolicy = InvalidOfferPolicy::PLACE_LAST;
    UsageFactorMarketStrategy lenient(pool, ledger, settings);

    lenient.add("task", makeOffer("neg", -1.0, 100.0));
    lenient.add("task", makeOffer("dear", 3.0, 100.0));
    lenient.add("task", makeOffer("nan-perf", 1.0, std::nan("")));
    lenient.add("task", makeOffer("cheap", 1.0, 100.0));

    auto ranked = lenient.resolveTaskOffersScored("task");
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].offer.providerId, "cheap");
    EXPECT_EQ(ranked[1].offer.providerId, "dear");
    EXPECT_EQ(ranked[2].offer.providerId, "neg");
    EXPECT_EQ(ranked[3].offer.providerId, "nan-perf");
    EXPECT_FALSE(ranked[2].valid);
    EXPECT_FALSE(ranked[3].valid);
}

TEST_F(MarketStrategyTest, ZeroReferenceLeavesFactor) {
    MarketSettings settings;
    settings.usageBenchmark = 0.0;
    UsageFactorMarketStrategy strategy(pool, ledger, settings);
    // A non-positive benchmark is replaced by the default.
    EXPECT_DOUBLE_EQ(strategy.getMyUsageBenchmark(), 1.0);

    ASSERT_TRUE(ledger.recordUsage("A", 2.0, 1.0).ok());
    EXPECT_TRUE(ledger.recordUsage("A", 9.0, 0.0).failed());
    EXPECT_DOUBLE_EQ(strategy.getUsageFactor("A", 1.0), 2.0);
}

TEST_F(MarketStrategyTest, BadUsageReportsRejected) {
    auto report = adjusted->reportSubtaskUsages("task", {
        {"A", "s1", 2.0},
        {"B", "s2", -1.0},
        {"", "s3", 1.0},
        {"A", "s1", 7.0},
    });
    EXPECT_EQ(report.applied, 1u);
    ASSERT_EQ(report.rejected.size(), 3u);
    EXPECT_EQ(report.rejected[0].code, ErrorCode::INVALID_USAGE);
    EXPECT_EQ(report.rejected[2].code, ErrorCode::DUPLICATE_REPORT);
    EXPECT_DOUBLE_EQ(adjusted->getUsageFactor("A", 1.0), 2.0);
    EXPECT_DOUBLE_EQ(adjusted->getUsageFactor("B", 1.0), 1.0);
}

TEST_F(MarketStrategyTest, BenchmarkScalesEffectivePrice) {
    MarketSettings settings;
    settings.usageBenchmark = 2.0;
    UsageFactorMarketStrategy strategy(pool, ledger, settings);
    strategy.add("task", makeOffer("A", 5.0, 800.0));
    auto ranked = strategy.resolveTaskOffersScored("task");
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_NEAR(ranked[0].effectivePrice, 0.0125, 1e-12);

    // Observed usage is measured against the benchmark: 4 / 2 = 2.
    strategy.reportSubtaskUsages("task", {{"A", "s", 4.0}});
    EXPECT_DOUBLE_EQ(strategy.getUsageFactor("A", 2.0), 2.0);
}

TEST_F(MarketStrategyTest, PoolingKeepsArrivalOrder) {
    ASSERT_TRUE(ledger.recordUsage("slow", 10.0, 1.0).ok());
    pooling->add("task", makeOffer("dear", 9.0, 10.0));
    pooling->add("task", makeOffer("bad", -1.0, 10.0));
    pooling->add("task", makeOffer("slow", 1.0, 10.0));
    pooling->add("task", makeOffer("cheap", 0.5, 10.0));

    auto ranked = pooling->resolveTaskOffersScored("task");
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].offer.providerId, "dear");
    EXPECT_EQ(ranked[1].offer.providerId, "slow");
    EXPECT_EQ(ranked[2].offer.providerId, "cheap");
    EXPECT_DOUBLE_EQ(ranked[0].effectivePrice, 9.0);
}

TEST_F(MarketStrategyTest, ConcurrentAddsDuringResolveAreNotLost) {
    const int writers = 4;
    const int perWriter = 500;
    std::atomic<bool> done{false};
    std::atomic<size_t> resolved{0};

    std::thread resolver([&]() {
        while (!done) {
            resolved += adjusted->resolveTaskOffers("task").size();
        }
    });

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; w++) {
        threads.emplace_back([&, w]() {
            for (int i = 0; i < perWriter; i++) {
                adjusted->add("task", makeOffer("p" + std::to_string(w), 1.0 + i, 10.0));
            }
        });
    }
    for (auto& t : threads) t.join();
    done = true;
    resolver.join();

    resolved += adjusted->resolveTaskOffers("task").size();
    EXPECT_EQ(resolved.load(), static_cast<size_t>(writers * perWriter));
}

TEST_F(MarketStrategyTest, ConcurrentReportsAndResolves) {
    std::vector<std::thread> threads;
    for (int w = 0; w < 4; w++) {
        threads.emplace_back([&, w]() {
            for (int i = 0; i < 200; i++) {
                std::string sub = std::to_string(w) + "-" + std::to_string(i);
                adjusted->reportSubtaskUsages("task", {{"p", sub, 1.0 + w}});
                adjusted->add("other", makeOffer("p", 1.0, 10.0));
                adjusted->resolveTaskOffersScored("other");
            }
        });
    }
    for (auto& t : threads) t.join();

    double factor = adjusted->getUsageFactor("p", 1.0);
    EXPECT_GE(factor, 1.0);
    EXPECT_LE(factor, 4.0);
    EXPECT_EQ(adjusted->getTaskOfferCount("other"), 0u);
}
