#include "market/offer_pool.h"
#include "utils/logger.h"
#include <map>
#include <mutex>

namespace bazaar {
namespace market {

struct OfferPool::Impl {
    std::map<std::string, std::vector<Offer>> pools;
    mutable std::mutex mtx;
};

OfferPool::OfferPool() : impl_(std::make_unique<Impl>()) {}
OfferPool::~OfferPool() = default;

void OfferPool::add(const std::string& taskId, Offer offer) {
    size_t pooled = 0;
    std::string providerId = offer.providerId;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto& pool = impl_->pools[taskId];
        pool.push_back(std::move(offer));
        pooled = pool.size();
    }
    LOG_DEBUG("Offer accepted & added to pool. task=" + taskId +
              " provider=" + utils::Logger::redactAddress(providerId) +
              " pooled=" + std::to_string(pooled));
}

size_t OfferPool::count(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->pools.find(taskId);
    return it != impl_->pools.end() ? it->second.size() : 0;
}

void OfferPool::clear(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->pools.find(taskId);
    if (it == impl_->pools.end()) return;
    impl_->pools.erase(it);
}

void OfferPool::reset() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->pools.clear();
}

std::vector<Offer> OfferPool::drain(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->pools.find(taskId);
    if (it == impl_->pools.end()) return {};
    std::vector<Offer> offers = std::move(it->second);
    impl_->pools.erase(it);
    return offers;
}

std::vector<std::string> OfferPool::tasks() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    result.reserve(impl_->pools.size());
    for (const auto& [taskId, offers] : impl_->pools) {
        result.push_back(taskId);
    }
    return result;
}

size_t OfferPool::totalOffers() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t total = 0;
    for (const auto& [taskId, offers] : impl_->pools) {
        total += offers.size();
    }
    return total;
}

}
}
