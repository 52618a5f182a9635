#include "market/market_strategy.h"
#include "utils/logger.h"
#include <algorithm>
#include <cmath>

namespace bazaar {
namespace market {

PooledMarketStrategy::PooledMarketStrategy(OfferPool& pool, UsageLedger& ledger, const MarketSettings& settings)
    : pool_(pool), ledger_(ledger), settings_(settings) {
    if (!std::isfinite(settings_.usageBenchmark) || settings_.usageBenchmark <= 0.0) {
        LOG_WARN("Usage benchmark must be positive, falling back to default");
        settings_.usageBenchmark = DEFAULT_USAGE_BENCHMARK;
    }
}

void PooledMarketStrategy::add(const std::string& taskId, const Offer& offer) {
    pool_.add(taskId, offer);
}

size_t PooledMarketStrategy::getTaskOfferCount(const std::string& taskId) const {
    return pool_.count(taskId);
}

void PooledMarketStrategy::clearOffersForTask(const std::string& taskId) {
    pool_.clear(taskId);
}

std::vector<Offer> PooledMarketStrategy::resolveTaskOffers(const std::string& taskId) {
    std::vector<ScoredOffer> scored = resolveTaskOffersScored(taskId);
    std::vector<Offer> result;
    result.reserve(scored.size());
    for (auto& s : scored) {
        result.push_back(std::move(s.offer));
    }
    return result;
}

std::vector<ScoredOffer> PooledMarketStrategy::resolveTaskOffersScored(const std::string& taskId) {
    std::vector<Offer> offers = pool_.drain(taskId);
    if (offers.empty()) {
        LOG_DEBUG("No offers to resolve. task=" + taskId);
        return {};
    }

    size_t pooled = offers.size();
    std::vector<ScoredOffer> ranked = applyInvalidOfferPolicy(taskId, rank(std::move(offers)));

    LOG_MARKET(utils::LogLevel::INFO, "Resolved task " + taskId + " with " + id() + ": " +
               std::to_string(ranked.size()) + " of " + std::to_string(pooled) + " offers ranked");
    return ranked;
}

std::vector<ScoredOffer> PooledMarketStrategy::applyInvalidOfferPolicy(const std::string& taskId,
                                                                       std::vector<ScoredOffer> ranked) const {
    auto firstInvalid = std::stable_partition(ranked.begin(), ranked.end(),
                                              [](const ScoredOffer& s) { return s.valid; });

    for (auto it = firstInvalid; it != ranked.end(); ++it) {
        auto check = PerformanceModel::validate(it->offer);
        std::string reason = check.failed() ? describe(check.error()) : "invalid usage factor";
        LOG_WARN("Offer rejected from ranking. task=" + taskId + " provider=" +
                 utils::Logger::redactAddress(it->offer.providerId) + " reason=" + reason);
    }

    if (settings_.invalidOfferPolicy == InvalidOfferPolicy::EXCLUDE) {
        ranked.erase(firstInvalid, ranked.end());
    }
    return ranked;
}

UsageReportResult PooledMarketStrategy::reportSubtaskUsages(const std::string& taskId,
                                                            const std::vector<UsageObservation>& usages) {
    UsageReportResult result;
    for (const auto& usage : usages) {
        auto recorded = ledger_.recordSubtaskUsage(taskId, usage.subtaskId, usage.providerId,
                                                   usage.observedUsage, settings_.usageBenchmark);
        if (recorded.failed()) {
            LOG_WARN("Usage report rejected. provider=" + utils::Logger::redactAddress(usage.providerId) +
                     " " + describe(recorded.error()));
            result.rejected.push_back(recorded.error());
            continue;
        }
        result.applied++;
    }

    LOG_MARKET(utils::LogLevel::INFO, "Usage reported for task " + taskId + ": " +
               std::to_string(result.applied) + " applied, " +
               std::to_string(result.rejected.size()) + " rejected");
    return result;
}

double PooledMarketStrategy::getMyUsageBenchmark() const {
    return settings_.usageBenchmark;
}

double PooledMarketStrategy::getUsageFactor(const std::string& providerId, double /*fallbackBenchmark*/) const {
    return ledger_.getFactor(providerId);
}

void PooledMarketStrategy::reset() {
    pool_.reset();
    ledger_.reset();
}

std::vector<ScoredOffer> PoolingMarketStrategy::rank(std::vector<Offer> offers) const {
    std::vector<ScoredOffer> ranked;
    ranked.reserve(offers.size());
    for (auto& offer : offers) {
        ScoredOffer s;
        s.valid = PerformanceModel::validate(offer).ok();
        s.effectivePrice = offer.price;
        s.offer = std::move(offer);
        ranked.push_back(std::move(s));
    }
    return ranked;
}

std::vector<ScoredOffer> UsageFactorMarketStrategy::rank(std::vector<Offer> offers) const {
    std::vector<ScoredOffer> ranked;
    ranked.reserve(offers.size());
    for (auto& offer : offers) {
        ScoredOffer s;
        s.usageFactor = ledger_.getFactor(offer.providerId);
        auto price = PerformanceModel::effectivePrice(offer, s.usageFactor, settings_.usageBenchmark);
        s.valid = price.ok();
        s.effectivePrice = price.valueOr(0.0);
        s.offer = std::move(offer);
        ranked.push_back(std::move(s));
    }

    // Invalid offers keep their arrival order behind the valid ones.
    std::stable_sort(ranked.begin(), ranked.end(), [](const ScoredOffer& a, const ScoredOffer& b) {
        if (a.valid != b.valid) return a.valid;
        if (!a.valid) return false;
        return a.effectivePrice < b.effectivePrice;
    });
    return ranked;
}

}
}
