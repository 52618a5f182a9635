#pragma once

#include "market/offer.h"
#include "market/offer_pool.h"
#include "market/performance_model.h"
#include "market/usage_ledger.h"
#include <string>
#include <vector>
#include <cstddef>

namespace bazaar {
namespace market {

struct MarketSettings {
    double usageBenchmark = DEFAULT_USAGE_BENCHMARK;
    InvalidOfferPolicy invalidOfferPolicy = InvalidOfferPolicy::EXCLUDE;
};

// Requestor-side market strategy. Per task: offers pool up (Open), a resolve
// ranks and drains them (Resolved), and a later add reopens the task.
class MarketStrategy {
public:
    virtual ~MarketStrategy() = default;

    virtual std::string id() const = 0;

    virtual void add(const std::string& taskId, const Offer& offer) = 0;
    virtual size_t getTaskOfferCount(const std::string& taskId) const = 0;
    virtual void clearOffersForTask(const std::string& taskId) = 0;

    virtual std::vector<Offer> resolveTaskOffers(const std::string& taskId) = 0;
    virtual std::vector<ScoredOffer> resolveTaskOffersScored(const std::string& taskId) = 0;

    virtual UsageReportResult reportSubtaskUsages(const std::string& taskId,
                                                  const std::vector<UsageObservation>& usages) = 0;

    virtual double getMyUsageBenchmark() const = 0;
    virtual double getUsageFactor(const std::string& providerId, double fallbackBenchmark) const = 0;

    virtual void reset() = 0;
};

// Shared pooling and feedback plumbing. Subclasses decide the order in rank().
class PooledMarketStrategy : public MarketStrategy {
public:
    PooledMarketStrategy(OfferPool& pool, UsageLedger& ledger, const MarketSettings& settings);

    void add(const std::string& taskId, const Offer& offer) override;
    size_t getTaskOfferCount(const std::string& taskId) const override;
    void clearOffersForTask(const std::string& taskId) override;

    std::vector<Offer> resolveTaskOffers(const std::string& taskId) override;
    std::vector<ScoredOffer> resolveTaskOffersScored(const std::string& taskId) override;

    UsageReportResult reportSubtaskUsages(const std::string& taskId,
                                          const std::vector<UsageObservation>& usages) override;

    double getMyUsageBenchmark() const override;
    double getUsageFactor(const std::string& providerId, double fallbackBenchmark) const override;

    void reset() override;

    const MarketSettings& settings() const { return settings_; }

protected:
    // Receives offers in submission order and returns them ranked. Invalid
    // offers must come back with valid == false.
    virtual std::vector<ScoredOffer> rank(std::vector<Offer> offers) const = 0;

    std::vector<ScoredOffer> applyInvalidOfferPolicy(const std::string& taskId,
                                                     std::vector<ScoredOffer> ranked) const;

    OfferPool& pool_;
    UsageLedger& ledger_;
    MarketSettings settings_;
};

// Pools offers and hands back the valid ones in arrival order.
class PoolingMarketStrategy : public PooledMarketStrategy {
public:
    static constexpr const char* ID = "pooling-only";

    using PooledMarketStrategy::PooledMarketStrategy;

    std::string id() const override { return ID; }

protected:
    std::vector<ScoredOffer> rank(std::vector<Offer> offers) const override;
};

// Ranks by effective price with declared performance discounted by each
// provider's usage factor. Ties keep arrival order.
class UsageFactorMarketStrategy : public PooledMarketStrategy {
public:
    static constexpr const char* ID = "usage-factor-adjusted";

    using PooledMarketStrategy::PooledMarketStrategy;

    std::string id() const override { return ID; }

protected:
    std::vector<ScoredOffer> rank(std::vector<Offer> offers) const override;
};

}
}
