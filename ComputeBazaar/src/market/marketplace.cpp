#include "market/marketplace.h"
#include "database/usage_factor_store.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <cmath>

namespace bazaar {
namespace market {

Marketplace::Marketplace(const MarketSettings& settings) : settings_(settings) {
    if (!std::isfinite(settings_.usageBenchmark) || settings_.usageBenchmark <= 0.0) {
        LOG_WARN("Usage benchmark must be positive, falling back to default");
        settings_.usageBenchmark = DEFAULT_USAGE_BENCHMARK;
    }

    auto usageFactor = registry_.registerStrategy(
        std::make_shared<UsageFactorMarketStrategy>(pool_, ledger_, settings_));
    auto pooling = registry_.registerStrategy(
        std::make_shared<PoolingMarketStrategy>(pool_, ledger_, settings_));
    if (usageFactor.failed() || pooling.failed()) {
        LOG_ERROR("Built-in market strategy registration failed");
    }

    // Older task headers name the strategies by these.
    static const char* const ALIASES[][2] = {
        {"usage-factor", UsageFactorMarketStrategy::ID},
        {"wasm", UsageFactorMarketStrategy::ID},
        {"pooling", PoolingMarketStrategy::ID},
    };
    for (const auto& alias : ALIASES) {
        auto r = registry_.registerAlias(alias[0], alias[1]);
        if (r.failed()) {
            LOG_WARN("Strategy alias not registered: " + describe(r.error()));
        }
    }

    auto def = registry_.setDefault(UsageFactorMarketStrategy::ID);
    if (def.failed()) {
        LOG_ERROR("Default market strategy unavailable: " + describe(def.error()));
    }
}

Marketplace::~Marketplace() = default;

Result<MarketSettings> Marketplace::settingsFromConfig(const utils::MarketConfig& config) {
    MarketSettings settings;
    if (!std::isfinite(config.usageBenchmark) || config.usageBenchmark <= 0.0) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "market.usage_benchmark must be positive");
    }
    settings.usageBenchmark = config.usageBenchmark;

    if (!parseInvalidOfferPolicy(config.invalidOfferPolicy, settings.invalidOfferPolicy)) {
        return makeError(ErrorCode::INVALID_ARGUMENT,
                         "unknown market.invalid_offer_policy '" + config.invalidOfferPolicy + "'");
    }
    return settings;
}

Result<std::shared_ptr<MarketStrategy>> Marketplace::strategyFor(const std::string& strategyId) const {
    if (strategyId.empty()) {
        auto strategy = registry_.defaultStrategy();
        if (!strategy) return makeError(ErrorCode::UNKNOWN_STRATEGY, "no default market strategy");
        return strategy;
    }
    return registry_.get(strategyId);
}

std::shared_ptr<MarketStrategy> Marketplace::defaultStrategy() const {
    return registry_.defaultStrategy();
}

Result<void> Marketplace::setDefaultStrategy(const std::string& strategyId) {
    auto r = registry_.setDefault(strategyId);
    if (r.ok()) {
        LOG_INFO("Default market strategy: " + registry_.defaultStrategy()->id());
    }
    return r;
}

Result<size_t> Marketplace::restore(database::UsageFactorStore& store) {
    auto stored = store.loadAll();
    if (stored.failed()) return stored.error();

    size_t accepted = ledger_.load(stored.value());
    if (accepted != stored.value().size()) {
        LOG_WARN("Ignored " + std::to_string(stored.value().size() - accepted) +
                 " invalid stored usage factors");
    }
    LOG_INFO("Restored " + std::to_string(accepted) + " usage factors");
    return accepted;
}

Result<size_t> Marketplace::flush(database::UsageFactorStore& store) {
    std::map<std::string, double> dirty = ledger_.takeDirty();
    if (dirty.empty()) return static_cast<size_t>(0);

    auto saved = store.saveAll(dirty);
    if (saved.failed()) {
        ledger_.requeueDirty(dirty);
        return saved.error();
    }
    LOG_DEBUG("Flushed " + std::to_string(dirty.size()) + " usage factors");
    return dirty.size();
}

void Marketplace::finishTask(const std::string& taskId) {
    pool_.clear(taskId);
    size_t forgotten = ledger_.forgetTask(taskId);
    LOG_DEBUG("Task finished. task=" + taskId + " reports=" + std::to_string(forgotten));
}

void Marketplace::reset() {
    pool_.reset();
    ledger_.reset();
}

Result<void> Marketplace::purge(database::UsageFactorStore& store) {
    reset();
    auto cleared = store.clear();
    if (cleared.failed()) return cleared;
    LOG_INFO("Usage factors purged from " + store.getPath());
    return cleared;
}

}
}
