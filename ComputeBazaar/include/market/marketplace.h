#pragma once

#include "market/market_strategy.h"
#include "market/offer_pool.h"
#include "market/strategy_registry.h"
#include "market/usage_ledger.h"
#include "infrastructure/error_handling.h"
#include <memory>
#include <string>

namespace bazaar {

namespace database {
class UsageFactorStore;
}

namespace utils {
struct MarketConfig;
}

namespace market {

// The requestor marketplace of one node: a single offer pool and usage ledger
// shared by every registered strategy. Owned by the node and passed to the
// task dispatch and offer reception layers by reference.
class Marketplace {
public:
    explicit Marketplace(const MarketSettings& settings = MarketSettings());
    ~Marketplace();
    Marketplace(const Marketplace&) = delete;
    Marketplace& operator=(const Marketplace&) = delete;

    static Result<MarketSettings> settingsFromConfig(const utils::MarketConfig& config);

    Result<std::shared_ptr<MarketStrategy>> strategyFor(const std::string& strategyId) const;
    std::shared_ptr<MarketStrategy> defaultStrategy() const;
    Result<void> setDefaultStrategy(const std::string& strategyId);

    MarketStrategyRegistry& registry() { return registry_; }
    OfferPool& pool() { return pool_; }
    UsageLedger& ledger() { return ledger_; }
    const MarketSettings& settings() const { return settings_; }

    // Seeds the ledger from persisted factors.
    Result<size_t> restore(database::UsageFactorStore& store);
    // Writes factors changed since the last flush.
    Result<size_t> flush(database::UsageFactorStore& store);

    // Ends a task: drops its pooled offers and its report history.
    void finishTask(const std::string& taskId);

    void reset();
    // reset() plus removal of every persisted factor, so a later restore
    // starts from neutral.
    Result<void> purge(database::UsageFactorStore& store);

private:
    MarketSettings settings_;
    OfferPool pool_;
    UsageLedger ledger_;
    MarketStrategyRegistry registry_;
};

}
}
