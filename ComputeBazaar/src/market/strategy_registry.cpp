#include "market/strategy_registry.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

namespace bazaar {
namespace market {

static std::string normalizeId(const std::string& id) {
    std::string v = id;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(v.begin(), v.end(), '_', '-');
    return v;
}

struct MarketStrategyRegistry::Impl {
    std::map<std::string, std::shared_ptr<MarketStrategy>> strategies;
    std::map<std::string, std::string> aliases;
    std::string defaultId;
    mutable std::mutex mtx;

    std::string canonical(const std::string& id) const;
};

std::string MarketStrategyRegistry::Impl::canonical(const std::string& id) const {
    std::string key = normalizeId(id);
    auto alias = aliases.find(key);
    return alias != aliases.end() ? alias->second : key;
}

MarketStrategyRegistry::MarketStrategyRegistry() : impl_(std::make_unique<Impl>()) {}
MarketStrategyRegistry::~MarketStrategyRegistry() = default;

Result<void> MarketStrategyRegistry::registerStrategy(std::shared_ptr<MarketStrategy> strategy) {
    if (!strategy) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "null market strategy");
    }
    std::string key = normalizeId(strategy->id());
    if (key.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "market strategy has an empty id");
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->strategies.count(key) > 0 || impl_->aliases.count(key) > 0) {
        return makeError(ErrorCode::ALREADY_EXISTS, "market strategy already registered", key);
    }
    impl_->strategies[key] = std::move(strategy);
    if (impl_->defaultId.empty()) {
        impl_->defaultId = key;
    }
    LOG_DEBUG("Market strategy registered: " + key);
    return Result<void>();
}

Result<void> MarketStrategyRegistry::registerAlias(const std::string& alias, const std::string& strategyId) {
    std::string key = normalizeId(alias);
    std::string target = normalizeId(strategyId);
    if (key.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "empty strategy alias");
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->strategies.count(target) == 0) {
        return makeError(ErrorCode::UNKNOWN_STRATEGY, "alias target is not registered", strategyId);
    }
    if (impl_->strategies.count(key) > 0 || impl_->aliases.count(key) > 0) {
        return makeError(ErrorCode::ALREADY_EXISTS, "strategy alias already registered", key);
    }
    impl_->aliases[key] = target;
    return Result<void>();
}

Result<std::shared_ptr<MarketStrategy>> MarketStrategyRegistry::get(const std::string& strategyId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->strategies.find(impl_->canonical(strategyId));
    if (it == impl_->strategies.end()) {
        return makeError(ErrorCode::UNKNOWN_STRATEGY, "no market strategy named '" + strategyId + "'");
    }
    return it->second;
}

bool MarketStrategyRegistry::contains(const std::string& strategyId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->strategies.count(impl_->canonical(strategyId)) > 0;
}

std::vector<std::string> MarketStrategyRegistry::ids() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [id, strategy] : impl_->strategies) {
        result.push_back(id);
    }
    return result;
}

Result<void> MarketStrategyRegistry::setDefault(const std::string& strategyId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string key = impl_->canonical(strategyId);
    if (impl_->strategies.count(key) == 0) {
        return makeError(ErrorCode::UNKNOWN_STRATEGY, "no market strategy named '" + strategyId + "'");
    }
    impl_->defaultId = key;
    return Result<void>();
}

std::shared_ptr<MarketStrategy> MarketStrategyRegistry::defaultStrategy() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->strategies.find(impl_->defaultId);
    return it != impl_->strategies.end() ? it->second : nullptr;
}

}
}
