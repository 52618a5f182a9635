#pragma once

#include "market/market_strategy.h"
#include "infrastructure/error_handling.h"
#include <memory>
#include <string>
#include <vector>

namespace bazaar {
namespace market {

// Maps a task's market strategy identifier (or one of its aliases) to the
// implementation that serves it. Lookups are case-insensitive.
class MarketStrategyRegistry {
public:
    MarketStrategyRegistry();
    ~MarketStrategyRegistry();
    MarketStrategyRegistry(const MarketStrategyRegistry&) = delete;
    MarketStrategyRegistry& operator=(const MarketStrategyRegistry&) = delete;

    Result<void> registerStrategy(std::shared_ptr<MarketStrategy> strategy);
    Result<void> registerAlias(const std::string& alias, const std::string& strategyId);

    Result<std::shared_ptr<MarketStrategy>> get(const std::string& strategyId) const;
    bool contains(const std::string& strategyId) const;
    std::vector<std::string> ids() const;

    Result<void> setDefault(const std::string& strategyId);
    std::shared_ptr<MarketStrategy> defaultStrategy() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
