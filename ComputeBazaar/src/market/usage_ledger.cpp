#include "market/usage_ledger.h"
#include "utils/logger.h"
#include <cmath>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace bazaar {
namespace market {

namespace {

std::string formatValue(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

Result<double> computeFactor(const std::string& providerId, double observedUsage, double referenceUsage) {
    if (providerId.empty()) {
        return makeError(ErrorCode::INVALID_USAGE, "empty provider id");
    }
    if (!std::isfinite(referenceUsage) || referenceUsage <= 0.0) {
        return makeError(ErrorCode::INVALID_USAGE,
                         "reference usage must be positive, got " + formatValue(referenceUsage),
                         providerId);
    }
    if (!std::isfinite(observedUsage) || observedUsage <= 0.0) {
        return makeError(ErrorCode::INVALID_USAGE,
                         "observed usage must be positive, got " + formatValue(observedUsage),
                         providerId);
    }
    double factor = observedUsage / referenceUsage;
    if (!std::isfinite(factor) || factor <= 0.0) {
        return makeError(ErrorCode::INVALID_USAGE,
                         "usage ratio is not a positive finite number", providerId);
    }
    return factor;
}

}

struct UsageLedger::Impl {
    std::unordered_map<std::string, double> factors;
    std::map<std::string, double> dirty;
    std::set<std::pair<std::string, std::string>> reported;
    mutable std::shared_mutex mtx;

    void store(const std::string& providerId, double factor);
};

void UsageLedger::Impl::store(const std::string& providerId, double factor) {
    factors[providerId] = factor;
    dirty[providerId] = factor;
}

UsageLedger::UsageLedger() : impl_(std::make_unique<Impl>()) {}
UsageLedger::~UsageLedger() = default;

double UsageLedger::getFactor(const std::string& providerId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    auto it = impl_->factors.find(providerId);
    return it != impl_->factors.end() ? it->second : NEUTRAL_USAGE_FACTOR;
}

bool UsageLedger::hasFactor(const std::string& providerId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->factors.find(providerId) != impl_->factors.end();
}

Result<double> UsageLedger::recordUsage(const std::string& providerId, double observedUsage,
                                        double referenceUsage) {
    auto factor = computeFactor(providerId, observedUsage, referenceUsage);
    if (factor.failed()) return factor;

    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        impl_->store(providerId, factor.value());
    }
    LOG_DEBUG("Usage factor updated. provider=" + utils::Logger::redactAddress(providerId) +
              " factor=" + formatValue(factor.value()));
    return factor;
}

Result<double> UsageLedger::recordSubtaskUsage(const std::string& taskId, const std::string& subtaskId,
                                               const std::string& providerId, double observedUsage,
                                               double referenceUsage) {
    if (subtaskId.empty()) {
        return makeError(ErrorCode::INVALID_USAGE, "empty subtask id", taskId);
    }
    auto factor = computeFactor(providerId, observedUsage, referenceUsage);
    if (factor.failed()) {
        Error err = factor.error();
        err.context = taskId + "/" + subtaskId;
        return err;
    }

    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        auto key = std::make_pair(taskId, subtaskId);
        if (impl_->reported.count(key) > 0) {
            return makeError(ErrorCode::DUPLICATE_REPORT,
                             "usage already reported for subtask", taskId + "/" + subtaskId);
        }
        impl_->reported.insert(std::move(key));
        impl_->store(providerId, factor.value());
    }
    LOG_DEBUG("Usage factor updated. provider=" + utils::Logger::redactAddress(providerId) +
              " subtask=" + subtaskId + " factor=" + formatValue(factor.value()));
    return factor;
}

bool UsageLedger::isReported(const std::string& taskId, const std::string& subtaskId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->reported.count(std::make_pair(taskId, subtaskId)) > 0;
}

size_t UsageLedger::forgetTask(const std::string& taskId) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    auto first = impl_->reported.lower_bound(std::make_pair(taskId, std::string()));
    auto last = first;
    size_t removed = 0;
    while (last != impl_->reported.end() && last->first == taskId) {
        ++last;
        ++removed;
    }
    impl_->reported.erase(first, last);
    return removed;
}

void UsageLedger::reset() {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->factors.clear();
    impl_->dirty.clear();
    impl_->reported.clear();
}

size_t UsageLedger::size() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->factors.size();
}

std::map<std::string, double> UsageLedger::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return std::map<std::string, double>(impl_->factors.begin(), impl_->factors.end());
}

size_t UsageLedger::load(const std::map<std::string, double>& factors) {
    size_t accepted = 0;
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    for (const auto& [providerId, factor] : factors) {
        if (providerId.empty() || !std::isfinite(factor) || factor <= 0.0) continue;
        impl_->factors[providerId] = factor;
        accepted++;
    }
    return accepted;
}

std::map<std::string, double> UsageLedger::takeDirty() {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    std::map<std::string, double> out;
    out.swap(impl_->dirty);
    return out;
}

void UsageLedger::requeueDirty(const std::map<std::string, double>& entries) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    for (const auto& [providerId, factor] : entries) {
        impl_->dirty.emplace(providerId, factor);
    }
}

}
}
